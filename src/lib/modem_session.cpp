#include "fonalink/modem/modem_session.h"

#include "fonalink/core/logging.h"
#include "fonalink/modem/at_response.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace fonalink::modem {

using fonalink::io::StatusCode;

static constexpr const char* TAG = "modem";

const char* to_string(ConnectionState state) noexcept
{
    switch (state) {
    case ConnectionState::Closed:       return "closed";
    case ConnectionState::Opening:      return "opening";
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Idle:         return "idle";
    case ConnectionState::Busy:         return "busy";
    case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

ModemSession::ModemSession(ModemSettings settings,
                           fonalink::io::IChannelFactory& channels,
                           fonalink::platform::ISleeper& sleeper)
    : _settings(std::move(settings))
    , _channels(channels)
    , _sleeper(sleeper)
    , _transport(channels)
{
    if (_settings.verbose) {
        FL_LOGI(TAG, "init(): port(%s) speed(%u) pin(%s) verbose(1)",
                _settings.port.c_str(),
                static_cast<unsigned>(_settings.baud),
                _settings.pin.empty() ? "" : "****");
    }
}

// ----------------------------
// Logging / result helpers
// ----------------------------
void ModemSession::info(const char* source, const std::string& text)
{
    if (_settings.verbose) {
        FL_LOGI(TAG, "%s(): %s", source, text.c_str());
    }
}

ModemResult ModemSession::warn(const char* source, const std::string& text)
{
    _error = std::string(source) + "(): " + text;
    FL_LOGW(TAG, "%s", _error.c_str());
    return ModemResult::warning(_error);
}

ModemResult ModemSession::fail(const char* source, const std::string& text)
{
    _error = std::string(source) + "(): " + text;
    _transport.close();
    _state = ConnectionState::Error;
    FL_LOGE(TAG, "%s", _error.c_str());
    return ModemResult::error(_error);
}

ModemResult ModemSession::request(const char* source, std::string_view command,
                                  std::vector<std::string>& lines)
{
    lines.clear();

    StatusCode st = _transport.write_line(command);
    if (st != StatusCode::Ok) {
        return fail(source, std::string("serial write failed (") + fonalink::io::to_string(st) +
                                "): " + _transport.last_error());
    }

    st = _transport.read_lines(lines);
    if (st != StatusCode::Ok) {
        return fail(source, std::string("serial read failed (") + fonalink::io::to_string(st) +
                                "): " + _transport.last_error());
    }

    if (_settings.verbose) {
        const std::string cmd = at_response::describe({std::string(command)});
        const std::string rsp = at_response::describe(lines);
        FL_LOGI(TAG, "request(): %s -> %s", cmd.c_str(), rsp.c_str());
    }

    return ModemResult::done(true);
}

// ----------------------------
// Lifecycle
// ----------------------------
ModemResult ModemSession::open()
{
    _error.clear();

    if (_state != ConnectionState::Closed) {
        return fail("open", std::string("Cannot open serial port: unknown status (") +
                                to_string(_state) + ")");
    }

    _state = ConnectionState::Opening;

    if (_transport.open(_settings.port, _settings.baud) != StatusCode::Ok) {
        return fail("open", "Error while opening serial port: " + _transport.last_error());
    }

    // Always at least one attempt.
    const int attempts = std::max(1, _settings.timings.openRetryCount);

    std::vector<std::string> lines;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        ModemResult r = request("open", CMD_ATTENTION, lines);
        if (r.is_error()) {
            return r;
        }

        if (at_response::last_line_starts_with_ok(lines)) {
            _state = ConnectionState::Disconnected;
            info("open", "module answered on " + _settings.port);
            return ModemResult::done(true);
        }

        // Module missing or still booting.
        _sleeper.sleep_for(_settings.timings.openRetrySleep);
    }

    return fail("open", "AT command does not provide the expected result");
}

ModemResult ModemSession::is_connected()
{
    if (!_transport.is_open()) {
        return ModemResult::done(false);
    }

    std::vector<std::string> lines;
    ModemResult r = request("is_connected", CMD_OPERATOR, lines);
    if (r.is_error()) {
        return r;
    }

    if (!at_response::last_line_is_ok(lines)) {
        return warn("is_connected", "Unexpected result while checking phone network");
    }

    switch (at_response::operator_status(lines)) {
    case at_response::OperatorStatus::Registered:
        return ModemResult::done(true);
    case at_response::OperatorStatus::NotRegistered:
        return ModemResult::done(false);
    case at_response::OperatorStatus::Unknown:
        break;
    }

    return warn("is_connected", "Unexpected result while checking phone network");
}

ModemResult ModemSession::connect()
{
    _error.clear();

    if (_state != ConnectionState::Disconnected) {
        return fail("connect", "Serial line is not opened: impossible to connect to the network");
    }

    ModemResult registered = is_connected();
    if (registered.is_error()) {
        return registered;
    }

    if (registered.succeeded()) {
        info("connect", "Already connected -> Skipping PIN code");
        _state = ConnectionState::Idle;
        return ModemResult::done(true);
    }

    // Not registered (or the answer was unreadable): enter the PIN.
    if (_settings.pin.empty()) {
        return warn("connect", "Not registered and no PIN code configured");
    }

    _state = ConnectionState::Connecting;

    std::vector<std::string> lines;
    ModemResult r = request("connect", std::string(CMD_PIN) + _settings.pin, lines);
    if (r.is_error()) {
        return r;
    }

    _sleeper.sleep_for(_settings.timings.pinSettle);

    registered = is_connected();
    if (registered.is_error()) {
        return registered;
    }

    if (registered.succeeded()) {
        info("connect", "registered to carrier");
        _state = ConnectionState::Idle;
        return ModemResult::done(true);
    }

    _state = ConnectionState::Disconnected;
    if (registered.is_warning()) {
        return registered;
    }
    info("connect", "carrier registration not confirmed after PIN");
    return ModemResult::done(false);
}

ModemResult ModemSession::send(std::string_view phone, std::string_view message)
{
    _error.clear();

    if (_state == ConnectionState::Error) {
        return fail("send", "session is in error state");
    }
    if (_state != ConnectionState::Idle) {
        return warn("send", std::string("session is not idle (") + to_string(_state) + ")");
    }

    _state = ConnectionState::Busy;

    // Force TEXT mode (instead of PDU).
    std::vector<std::string> lines;
    ModemResult r = request("send", CMD_TEXT_MODE, lines);
    if (r.is_error()) {
        return r;
    }
    if (!at_response::last_line_is_ok(lines)) {
        _state = ConnectionState::Idle;
        return warn("send", "The message format could not be set to TEXT");
    }

    std::string compose(CMD_SEND_SMS);
    compose += '"';
    compose.append(phone.data(), phone.size());
    compose += '"';

    r = request("send", compose, lines);
    if (r.is_error()) {
        return r;
    }

    std::string body(message);
    body += CTRL_Z;

    r = request("send", body, lines);
    if (r.is_error()) {
        return r;
    }

    _state = ConnectionState::Idle;
    return ModemResult::done(true);
}

void ModemSession::close() noexcept
{
    _error.clear();
    _transport.close();
    _state = ConnectionState::Closed;
}

ModemResult ModemSession::panic()
{
    _transport.close();
    _state = ConnectionState::Closed;

    // Fresh connection used only for the power-down command.
    fonalink::io::AtTransport raw(_channels);
    std::string detail;

    if (raw.open(_settings.port, _settings.baud) != StatusCode::Ok) {
        detail = " (power-down not sent: " + raw.last_error() + ")";
    } else if (raw.write_line(CMD_POWER_DOWN) != StatusCode::Ok) {
        detail = " (power-down not sent: " + raw.last_error() + ")";
    }
    raw.close();

    return fail("panic", "Device in panic mode" + detail);
}

ModemResult ModemSession::start()
{
    ModemResult r = open();
    if (!r.succeeded()) {
        return r;
    }
    return connect();
}

} // namespace fonalink::modem
