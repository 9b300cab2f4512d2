#pragma once

#include "fonalink/diag/diagnostic_types.h"

#include <memory>
#include <string_view>
#include <vector>

namespace fonalink::modem { class ModemSession; }

namespace fonalink::diag {

// Providers publish a set of commands and execute them.
class IDiagnosticProvider {
public:
    virtual ~IDiagnosticProvider() = default;

    // Stable provider identifier, e.g. "sms".
    virtual std::string_view provider_id() const noexcept = 0;

    virtual void list_commands(std::vector<DiagCommandSpec>& out) const = 0;

    // Execute a command. `args.argv[0]` is the command name.
    // Provider should return NotFound if it doesn't recognize the command.
    virtual DiagResult execute(const DiagArgsView& args) = 0;
};

// Session provider: status, registration query, send, close.
// The session must outlive the provider.
std::unique_ptr<IDiagnosticProvider> create_session_diagnostic_provider(::fonalink::modem::ModemSession& session);

} // namespace fonalink::diag
