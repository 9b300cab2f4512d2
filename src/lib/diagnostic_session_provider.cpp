#include "fonalink/diag/diagnostic_provider.h"

#include "fonalink/modem/modem_session.h"
#include "fonalink/modem/modem_types.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fonalink::diag {

namespace {

using fonalink::modem::ModemResult;
using fonalink::modem::ModemSession;

// Maps a session outcome onto a diagnostic result.
static DiagResult from_modem_result(const ModemResult& r, std::string okText)
{
    if (r.is_error()) return DiagResult::error(r.text + "\r\n");
    if (r.is_warning()) return DiagResult::not_ready(r.text + "\r\n");
    return DiagResult::ok(std::move(okText));
}

class SessionDiagnosticProvider final : public IDiagnosticProvider {
public:
    explicit SessionDiagnosticProvider(ModemSession& session)
        : _session(session)
    {}

    std::string_view provider_id() const noexcept override { return "sms"; }

    void list_commands(std::vector<DiagCommandSpec>& out) const override
    {
        out.push_back(DiagCommandSpec{
            "sms.status",
            "show session state (state, link, port, last error)",
            "sms.status",
        });
        out.push_back(DiagCommandSpec{
            "sms.connected",
            "query carrier registration (AT+COPS?)",
            "sms.connected",
        });
        out.push_back(DiagCommandSpec{
            "sms.send",
            "send a TEXT mode SMS",
            "sms.send <phone> <text...>",
        });
        out.push_back(DiagCommandSpec{
            "sms.close",
            "close the serial link",
            "sms.close",
        });
    }

    DiagResult execute(const DiagArgsView& args) override
    {
        if (args.argv.empty()) {
            return DiagResult::invalid_args("missing command");
        }

        const std::string_view cmd = args.argv[0];
        if (cmd == "sms.status") return cmd_status();
        if (cmd == "sms.connected") return cmd_connected();
        if (cmd == "sms.send") return cmd_send(args);
        if (cmd == "sms.close") return cmd_close();

        return DiagResult::not_found("unknown sms command");
    }

private:
    DiagResult cmd_status()
    {
        const auto& s = _session.settings();
        const char* state = fonalink::modem::to_string(_session.state());

        std::string text;
        text.reserve(128);
        text += "state: "; text += state; text += "\r\n";
        text += "link: "; text += (_session.link_open() ? "1" : "0"); text += "\r\n";
        text += "port: "; text += s.port; text += "\r\n";
        text += "baud: "; text += std::to_string(s.baud); text += "\r\n";
        text += "verbose: "; text += (s.verbose ? "1" : "0"); text += "\r\n";
        text += "error: "; text += _session.error(); text += "\r\n";

        DiagResult r = DiagResult::ok(text);
        r.kv.emplace_back("state", state);
        r.kv.emplace_back("link", _session.link_open() ? "1" : "0");
        r.kv.emplace_back("error", _session.error());
        return r;
    }

    DiagResult cmd_connected()
    {
        const ModemResult r = _session.is_connected();
        DiagResult out = from_modem_result(r, std::string("connected: ") + (r.succeeded() ? "1" : "0") + "\r\n");
        out.kv.emplace_back("connected", r.succeeded() ? "1" : "0");
        return out;
    }

    DiagResult cmd_send(const DiagArgsView& args)
    {
        if (args.argv.size() < 3) {
            return DiagResult::invalid_args("usage: sms.send <phone> <text...>");
        }

        // Join args[2..] with spaces (user types: sms.send 0470123456 see you at 8)
        std::string text;
        text.reserve(64);
        for (std::size_t i = 2; i < args.argv.size(); ++i) {
            if (i > 2) text.push_back(' ');
            text.append(args.argv[i].data(), args.argv[i].size());
        }

        const ModemResult r = _session.send(args.argv[1], text);
        return from_modem_result(r, "sent\r\n");
    }

    DiagResult cmd_close()
    {
        _session.close();
        return DiagResult::ok("closed\r\n");
    }

    ModemSession& _session;
};

} // namespace

std::unique_ptr<IDiagnosticProvider> create_session_diagnostic_provider(::fonalink::modem::ModemSession& session)
{
    return std::make_unique<SessionDiagnosticProvider>(session);
}

} // namespace fonalink::diag
