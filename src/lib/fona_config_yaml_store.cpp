#include "fonalink/config/fona_config_yaml_store.h"
#include "fonalink/core/logging.h"

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace fonalink::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, ModemConfig& out)
{
    out.port    = get_or<std::string>(node, "port", out.port);
    out.baud    = get_or<std::uint32_t>(node, "baud", out.baud);
    // PINs are often written unquoted (pin: 4250); read the scalar as text.
    out.pin     = get_or<std::string>(node, "pin", out.pin);
    out.verbose = get_or<bool>(node, "verbose", out.verbose);
}

static void from_yaml(const YAML::Node& node, TimingConfig& out)
{
    const int retries    = get_or<int>(node, "open_retry_count", out.openRetryCount);
    if (retries < 1) {
        FL_LOGW(TAG, "open_retry_count %d is below 1; keeping %d", retries, out.openRetryCount);
    } else {
        out.openRetryCount = retries;
    }
    out.openRetrySleepMs = get_or<std::uint32_t>(node, "open_retry_sleep_ms", out.openRetrySleepMs);
    out.pinSettleMs      = get_or<std::uint32_t>(node, "pin_settle_ms", out.pinSettleMs);
}

static void from_yaml(const YAML::Node& node, MessageConfig& out)
{
    out.phone = get_or<std::string>(node, "phone", out.phone);
    out.text  = get_or<std::string>(node, "text", out.text);
}

// Top-level FonaConfig mapper.
static void from_yaml(const YAML::Node& root, FonaConfig& cfg)
{
    if (!root || !root.IsMap()) {
        return;
    }

    if (auto n = root["modem"]) {
        from_yaml(n, cfg.modem);
    }

    if (auto n = root["timing"]) {
        from_yaml(n, cfg.timing);
    }

    if (auto n = root["message"]) {
        from_yaml(n, cfg.message);
    }
}

// ---------- to_yaml helpers ----------

static void to_yaml(YAML::Emitter& out, const FonaConfig& cfg)
{
    out << YAML::BeginMap;

    // modem:
    out << YAML::Key << "modem" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "port"    << YAML::Value << cfg.modem.port;
    out << YAML::Key << "baud"    << YAML::Value << cfg.modem.baud;
    out << YAML::Key << "pin"     << YAML::Value << YAML::DoubleQuoted << cfg.modem.pin;
    out << YAML::Key << "verbose" << YAML::Value << cfg.modem.verbose;
    out << YAML::EndMap;

    // timing:
    out << YAML::Key << "timing" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "open_retry_count"    << YAML::Value << cfg.timing.openRetryCount;
    out << YAML::Key << "open_retry_sleep_ms" << YAML::Value << cfg.timing.openRetrySleepMs;
    out << YAML::Key << "pin_settle_ms"       << YAML::Value << cfg.timing.pinSettleMs;
    out << YAML::EndMap;

    // message:
    out << YAML::Key << "message" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "phone" << YAML::Value << YAML::DoubleQuoted << cfg.message.phone;
    out << YAML::Key << "text"  << YAML::Value << cfg.message.text;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

FonaConfig parse_config_yaml(std::string_view text)
{
    FonaConfig cfg{};
    YAML::Node root = YAML::Load(std::string(text));
    from_yaml(root, cfg);
    return cfg;
}

std::string emit_config_yaml(const FonaConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return std::string(out.c_str());
}

fonalink::modem::ModemSettings to_modem_settings(const FonaConfig& cfg)
{
    fonalink::modem::ModemSettings s;
    s.port    = cfg.modem.port;
    s.baud    = cfg.modem.baud;
    s.pin     = cfg.modem.pin;
    s.verbose = cfg.modem.verbose;

    s.timings.openRetryCount = cfg.timing.openRetryCount;
    s.timings.openRetrySleep = std::chrono::milliseconds(cfg.timing.openRetrySleepMs);
    s.timings.pinSettle      = std::chrono::milliseconds(cfg.timing.pinSettleMs);
    return s;
}

// ---------- YamlFonaConfigStore methods ----------

YamlFonaConfigStore::YamlFonaConfigStore(std::string path)
    : _path(std::move(path))
{
}

FonaConfig YamlFonaConfigStore::load()
{
    std::ifstream in(_path, std::ios::binary);
    if (!in) {
        FL_LOGW(TAG, "Config '%s' not found; writing defaults", _path.c_str());

        FonaConfig cfg{};
        try {
            save(cfg);
        } catch (const std::exception& ex) {
            FL_LOGE(TAG, "Failed to write default config '%s': %s", _path.c_str(), ex.what());
        }
        return cfg;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string yamlText = ss.str();

    if (yamlText.empty()) {
        FL_LOGW(TAG, "Config '%s' is empty; using defaults", _path.c_str());
        return FonaConfig{};
    }

    try {
        FonaConfig cfg = parse_config_yaml(yamlText);
        FL_LOGI(TAG, "Loaded config from '%s'", _path.c_str());
        return cfg;
    } catch (const std::exception& ex) {
        FL_LOGE(TAG, "Failed to load config from '%s': %s", _path.c_str(), ex.what());
    }

    return FonaConfig{};
}

void YamlFonaConfigStore::save(const FonaConfig& cfg)
{
    const std::string text = emit_config_yaml(cfg);

    std::ofstream out(_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("open for write failed");
    }

    out << text << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("short write while saving config");
    }

    FL_LOGI(TAG, "Saved config to '%s'", _path.c_str());
}

} // namespace fonalink::config
