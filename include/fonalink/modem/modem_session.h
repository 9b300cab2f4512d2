#pragma once

#include "fonalink/io/core/channel.h"
#include "fonalink/io/transport/at_transport.h"
#include "fonalink/modem/modem_types.h"
#include "fonalink/platform/sleeper.h"

#include <string>
#include <string_view>
#include <vector>

namespace fonalink::modem {

// ModemSession: one FONA-class module on one serial port.
// - open() acquires the port and checks that the module answers "AT".
// - connect() registers to the carrier, entering the PIN when needed.
// - send() submits a TEXT mode SMS.
// Commands are strictly write-then-read; the module must have answered by
// the time the read happens. There is no correlation between a command and
// the bytes read after it.
class ModemSession {
public:
    ModemSession(ModemSettings settings,
                 fonalink::io::IChannelFactory& channels,
                 fonalink::platform::ISleeper& sleeper);

    ModemSession(const ModemSession&) = delete;
    ModemSession& operator=(const ModemSession&) = delete;

    // Closed -> Disconnected. Any failure is fatal.
    ModemResult open();

    // Disconnected -> Idle. value == false when registration did not happen.
    ModemResult connect();

    // Queries carrier registration. Does not change state.
    ModemResult is_connected();

    // Idle -> Busy -> Idle. value == true once both SMS commands were issued;
    // delivery is not confirmed.
    ModemResult send(std::string_view phone, std::string_view message);

    // Releases the port from any state, including Error.
    void close() noexcept;

    // Hard power-down through a fresh raw connection. Always ends in Error.
    ModemResult panic();

    // open() then connect(). Callers check state() before issuing commands.
    ModemResult start();

    ConnectionState    state() const noexcept { return _state; }
    const std::string& error() const noexcept { return _error; }
    const ModemSettings& settings() const noexcept { return _settings; }
    bool link_open() const noexcept { return _transport.is_open(); }

private:
    static constexpr const char* CMD_ATTENTION  = "AT";
    static constexpr const char* CMD_PIN        = "AT+CPIN=";
    static constexpr const char* CMD_OPERATOR   = "AT+COPS?";
    static constexpr const char* CMD_TEXT_MODE  = "AT+CMGF=1";
    static constexpr const char* CMD_SEND_SMS   = "AT+CMGS=";
    static constexpr const char* CMD_POWER_DOWN = "AT+CPOWD=1";
    static constexpr char        CTRL_Z         = '\x1a';

    const ModemSettings _settings;
    fonalink::io::IChannelFactory& _channels;
    fonalink::platform::ISleeper& _sleeper;

    fonalink::io::AtTransport _transport;
    ConnectionState _state{ConnectionState::Closed};
    std::string _error;

    // Writes one command and reads whatever the module has answered so far.
    ModemResult request(const char* source, std::string_view command,
                        std::vector<std::string>& lines);

    void        info(const char* source, const std::string& text);
    ModemResult warn(const char* source, const std::string& text);
    ModemResult fail(const char* source, const std::string& text);
};

} // namespace fonalink::modem
