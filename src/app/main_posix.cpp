#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>

#include "fonalink/config/fona_config.h"
#include "fonalink/config/fona_config_yaml_store.h"
#include "fonalink/console/console_parse.h"
#include "fonalink/core/logging.h"
#include "fonalink/diag/diagnostic_provider.h"
#include "fonalink/modem/modem_session.h"
#include "fonalink/platform/posix/serial_channel.h"
#include "fonalink/platform/sleeper.h"

using namespace fonalink;

static const char* TAG = "app";

static void usage(const char* argv0)
{
    std::fprintf(stderr,
                 "usage: %s [-c <config.yaml>] [sms.<command> [args...]]\n"
                 "  no command: bring the modem up and send the configured message\n",
                 argv0);
}

static int run_command(diag::IDiagnosticProvider& provider, const std::string& line)
{
    diag::DiagArgsView args;
    args.line = line;
    args.argv = console::split_args(line);

    const diag::DiagResult r = provider.execute(args);
    std::cout << r.text;
    if (!r.text.empty() && r.text.back() != '\n') {
        std::cout << '\n';
    }
    return r.status == diag::DiagStatus::Ok ? 0 : 1;
}

int main(int argc, char** argv)
{
    std::string configPath = "fonalink.yaml";
    std::string commandLine;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        }
        if (arg == "-c") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            configPath = argv[++i];
            continue;
        }
        if (!commandLine.empty()) commandLine.push_back(' ');
        // Re-quote arguments containing spaces so split_args keeps them whole.
        if (arg.find(' ') != std::string_view::npos) {
            commandLine.push_back('"');
            commandLine.append(arg.data(), arg.size());
            commandLine.push_back('"');
        } else {
            commandLine.append(arg.data(), arg.size());
        }
    }

    config::YamlFonaConfigStore store(configPath);
    const config::FonaConfig cfg = store.load();

    platform::posix::SerialChannelFactory channels;
    modem::ModemSession session(config::to_modem_settings(cfg), channels, platform::system_sleeper());

    const modem::ModemResult up = session.start();
    auto provider = diag::create_session_diagnostic_provider(session);
    int rc = 0;

    if (session.state() != modem::ConnectionState::Idle) {
        FL_LOGE(TAG, "modem not ready (state %s): %s",
                modem::to_string(session.state()),
                up.text.empty() ? "carrier registration failed" : up.text.c_str());
        std::fprintf(stderr, "modem not ready (%s)\n", modem::to_string(session.state()));
        rc = 1;
    } else if (!commandLine.empty()) {
        rc = run_command(*provider, commandLine);
    } else if (cfg.message.phone.empty()) {
        FL_LOGW(TAG, "message.phone not set in '%s'; nothing to send", configPath.c_str());
    } else {
        const modem::ModemResult sent = session.send(cfg.message.phone, cfg.message.text);
        if (!sent.succeeded()) {
            std::fprintf(stderr, "send failed: %s\n", sent.text.c_str());
            rc = 1;
        }
    }

    session.close();
    std::cout << "+++ END-OF-EXECUTION +++" << std::endl;
    return rc;
}
