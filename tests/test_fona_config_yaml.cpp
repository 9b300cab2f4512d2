#include "doctest.h"

#include "fonalink/config/fona_config.h"
#include "fonalink/config/fona_config_yaml_store.h"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

using fonalink::config::FonaConfig;
using fonalink::config::YamlFonaConfigStore;
using fonalink::config::emit_config_yaml;
using fonalink::config::parse_config_yaml;
using fonalink::config::to_modem_settings;

namespace {

// Unique path under the system temp dir, removed on scope exit.
struct TempPath {
    std::filesystem::path path;

    TempPath()
    {
        static int counter = 0;
        path = std::filesystem::temp_directory_path() /
               ("fonalink_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".yaml");
        std::filesystem::remove(path);
    }

    ~TempPath()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::string str() const { return path.string(); }
};

void write_file(const TempPath& p, const std::string& content)
{
    std::ofstream out(p.path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_file(const TempPath& p)
{
    std::ifstream in(p.path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("FonaConfig: defaults")
{
    const FonaConfig cfg{};
    CHECK(cfg.modem.port == "/dev/ttyAMA0");
    CHECK(cfg.modem.baud == 115200);
    CHECK(cfg.modem.pin.empty());
    CHECK(cfg.modem.verbose == false);
    CHECK(cfg.timing.openRetryCount == 3);
    CHECK(cfg.timing.openRetrySleepMs == 5000);
    CHECK(cfg.timing.pinSettleMs == 10000);
    CHECK(cfg.message.text == "Hello, World!");
}

TEST_CASE("parse_config_yaml: full document")
{
    const std::string yaml = R"(
modem:
  port: "/dev/ttyUSB0"
  baud: 9600
  pin: 4250
  verbose: true
timing:
  open_retry_count: 4
  open_retry_sleep_ms: 250
  pin_settle_ms: 1500
message:
  phone: "+32470123456"
  text: "ping"
)";

    const FonaConfig cfg = parse_config_yaml(yaml);
    CHECK(cfg.modem.port == "/dev/ttyUSB0");
    CHECK(cfg.modem.baud == 9600);
    CHECK(cfg.modem.pin == "4250");
    CHECK(cfg.modem.verbose == true);
    CHECK(cfg.timing.openRetryCount == 4);
    CHECK(cfg.timing.openRetrySleepMs == 250);
    CHECK(cfg.timing.pinSettleMs == 1500);
    CHECK(cfg.message.phone == "+32470123456");
    CHECK(cfg.message.text == "ping");
}

TEST_CASE("parse_config_yaml: missing sections keep defaults")
{
    const FonaConfig cfg = parse_config_yaml("modem:\n  pin: \"0000\"\n");
    CHECK(cfg.modem.pin == "0000");
    CHECK(cfg.modem.port == "/dev/ttyAMA0");
    CHECK(cfg.modem.baud == 115200);
    CHECK(cfg.timing.openRetryCount == 3);
    CHECK(cfg.message.text == "Hello, World!");
}

TEST_CASE("parse_config_yaml: open_retry_count below one keeps the default")
{
    CHECK(parse_config_yaml("timing:\n  open_retry_count: 0\n").timing.openRetryCount == 3);
    CHECK(parse_config_yaml("timing:\n  open_retry_count: -2\n").timing.openRetryCount == 3);
    CHECK(parse_config_yaml("timing:\n  open_retry_count: 1\n").timing.openRetryCount == 1);
}

TEST_CASE("parse_config_yaml: malformed input throws")
{
    CHECK_THROWS(parse_config_yaml("modem: [unterminated"));
}

TEST_CASE("emit_config_yaml / parse_config_yaml preserve every field")
{
    FonaConfig in{};
    in.modem.port = "/dev/serial0";
    in.modem.baud = 57600;
    in.modem.pin = "0042";
    in.modem.verbose = true;
    in.timing.openRetryCount = 2;
    in.timing.openRetrySleepMs = 100;
    in.timing.pinSettleMs = 200;
    in.message.phone = "0470123456";
    in.message.text = "two words: yes";

    const FonaConfig out = parse_config_yaml(emit_config_yaml(in));
    CHECK(out.modem.port == in.modem.port);
    CHECK(out.modem.baud == in.modem.baud);
    // Leading zeros survive because the PIN is emitted quoted.
    CHECK(out.modem.pin == "0042");
    CHECK(out.modem.verbose == in.modem.verbose);
    CHECK(out.timing.openRetryCount == in.timing.openRetryCount);
    CHECK(out.timing.openRetrySleepMs == in.timing.openRetrySleepMs);
    CHECK(out.timing.pinSettleMs == in.timing.pinSettleMs);
    CHECK(out.message.phone == "0470123456");
    CHECK(out.message.text == in.message.text);
}

TEST_CASE("YamlFonaConfigStore: missing file writes defaults")
{
    TempPath p;
    YamlFonaConfigStore store(p.str());

    const FonaConfig cfg = store.load();
    CHECK(cfg.modem.port == "/dev/ttyAMA0");

    REQUIRE(std::filesystem::exists(p.path));
    const std::string text = read_file(p);
    CHECK(text.find("modem:") != std::string::npos);
    CHECK(text.find("open_retry_sleep_ms: 5000") != std::string::npos);
}

TEST_CASE("YamlFonaConfigStore: load existing file")
{
    TempPath p;
    write_file(p, "modem:\n  port: /dev/ttyS1\n  baud: 19200\n");

    YamlFonaConfigStore store(p.str());
    const FonaConfig cfg = store.load();
    CHECK(cfg.modem.port == "/dev/ttyS1");
    CHECK(cfg.modem.baud == 19200);
}

TEST_CASE("YamlFonaConfigStore: empty or malformed file yields defaults")
{
    TempPath p;
    YamlFonaConfigStore store(p.str());

    SUBCASE("empty") {
        write_file(p, "");
        CHECK(store.load().modem.port == "/dev/ttyAMA0");
    }

    SUBCASE("malformed") {
        write_file(p, "modem: [unterminated");
        CHECK(store.load().modem.baud == 115200);
        // The broken file is left for the user to fix.
        CHECK(read_file(p) == "modem: [unterminated");
    }
}

TEST_CASE("YamlFonaConfigStore: save then load")
{
    TempPath p;
    YamlFonaConfigStore store(p.str());

    FonaConfig cfg{};
    cfg.modem.pin = "1234";
    cfg.message.phone = "+3212345678";
    store.save(cfg);

    const FonaConfig back = store.load();
    CHECK(back.modem.pin == "1234");
    CHECK(back.message.phone == "+3212345678");
}

TEST_CASE("YamlFonaConfigStore: save into a missing directory throws")
{
    YamlFonaConfigStore store("/nonexistent-dir-fonalink/fonalink.yaml");
    CHECK_THROWS_AS(store.save(FonaConfig{}), std::runtime_error);
}

TEST_CASE("to_modem_settings maps timing to durations")
{
    FonaConfig cfg{};
    cfg.modem.port = "/dev/ttyUSB2";
    cfg.modem.pin = "9999";
    cfg.timing.openRetryCount = 7;
    cfg.timing.openRetrySleepMs = 30;
    cfg.timing.pinSettleMs = 40;

    const auto s = to_modem_settings(cfg);
    CHECK(s.port == "/dev/ttyUSB2");
    CHECK(s.baud == 115200);
    CHECK(s.pin == "9999");
    CHECK(s.timings.openRetryCount == 7);
    CHECK(s.timings.openRetrySleep == std::chrono::milliseconds(30));
    CHECK(s.timings.pinSettle == std::chrono::milliseconds(40));
}
