#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace fonalink::modem {

// Connection lifecycle of a ModemSession.
enum class ConnectionState : std::uint8_t {
    Closed,       // serial link not opened
    Opening,      // link acquired, probing for the module
    Disconnected, // module answers but is not registered to a carrier
    Connecting,   // PIN sent, waiting for registration
    Idle,         // ready for a command
    Busy,         // command in progress
    Error,        // unrecoverable; only close()/panic() are accepted
};

const char* to_string(ConnectionState state) noexcept;

enum class ResultStatus : std::uint8_t {
    Ok = 0,
    Warning, // operation failed, session state preserved
    Error,   // session is now in ConnectionState::Error
};

// Outcome of a session operation.
struct ModemResult {
    ResultStatus status{ResultStatus::Ok};

    // Operation answer (connected? sent?). Always false unless status is Ok.
    bool value{false};

    // Error or warning text; empty on success.
    std::string text;

    bool succeeded() const noexcept { return status == ResultStatus::Ok && value; }
    bool is_warning() const noexcept { return status == ResultStatus::Warning; }
    bool is_error() const noexcept { return status == ResultStatus::Error; }

    static ModemResult done(bool v = true) {
        ModemResult r;
        r.status = ResultStatus::Ok;
        r.value = v;
        return r;
    }

    static ModemResult warning(std::string t) {
        ModemResult r;
        r.status = ResultStatus::Warning;
        r.text = std::move(t);
        return r;
    }

    static ModemResult error(std::string t) {
        ModemResult r;
        r.status = ResultStatus::Error;
        r.text = std::move(t);
        return r;
    }
};

// Fixed waits used by the protocol. The module has no readiness signal, so
// these are elapsed-time waits, not timeouts.
struct ModemTimings {
    int                       openRetryCount{3};
    std::chrono::milliseconds openRetrySleep{5000};
    std::chrono::milliseconds pinSettle{10000};
};

// Immutable session parameters.
struct ModemSettings {
    std::string   port{"/dev/ttyAMA0"};
    std::uint32_t baud{115200};
    std::string   pin;
    bool          verbose{false};
    ModemTimings  timings;
};

} // namespace fonalink::modem
