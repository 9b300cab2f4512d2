#include "fonalink/io/transport/at_transport.h"

#include "fonalink/core/logging.h"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace fonalink::io {

static constexpr const char* TAG = "at_transport";

const char* to_string(StatusCode status) noexcept
{
    switch (status) {
    case StatusCode::Ok:             return "ok";
    case StatusCode::InvalidRequest: return "invalid request";
    case StatusCode::NotReady:       return "not open";
    case StatusCode::IOError:        return "i/o error";
    case StatusCode::OpenFailed:     return "open failed";
    }
    return "unknown";
}

AtTransport::AtTransport(IChannelFactory& factory)
    : _factory(factory)
{
}

AtTransport::~AtTransport()
{
    close();
}

StatusCode AtTransport::open(const std::string& port, std::uint32_t baud)
{
    close();
    _lastError.clear();

    if (port.empty()) {
        _lastError = "no port configured";
        return StatusCode::InvalidRequest;
    }

    std::string err;
    _channel = _factory.open(port, baud, err);
    if (!_channel) {
        _lastError = err.empty() ? ("cannot open " + port) : std::move(err);
        FL_LOGE(TAG, "open failed: %s", _lastError.c_str());
        return StatusCode::OpenFailed;
    }

    return StatusCode::Ok;
}

void AtTransport::close() noexcept
{
    _channel.reset();
}

StatusCode AtTransport::write_line(std::string_view line)
{
    _lastError.clear();

    if (!_channel) {
        _lastError = "channel not open";
        return StatusCode::NotReady;
    }

    std::string framed;
    framed.reserve(line.size() + 1);
    framed.append(line.data(), line.size());
    framed.push_back('\r');

    const auto* bytes = reinterpret_cast<const std::uint8_t*>(framed.data());
    const std::size_t written = _channel->write(bytes, framed.size());
    if (written != framed.size()) {
        _lastError = "short write (" + std::to_string(written) + "/" +
                     std::to_string(framed.size()) + " bytes)";
        return StatusCode::IOError;
    }

    if (!_channel->flush()) {
        _lastError = "flush failed";
        return StatusCode::IOError;
    }

    return StatusCode::Ok;
}

StatusCode AtTransport::read_lines(std::vector<std::string>& out)
{
    out.clear();
    _lastError.clear();

    if (!_channel) {
        _lastError = "channel not open";
        return StatusCode::NotReady;
    }

    std::string raw;
    std::array<std::uint8_t, READ_CHUNK> buf{};

    std::size_t pending = _channel->available();
    while (pending > 0) {
        const std::size_t want = std::min(pending, buf.size());
        const std::size_t n = _channel->read(buf.data(), want);
        if (n == 0) {
            break;
        }
        raw.append(reinterpret_cast<const char*>(buf.data()), n);
        pending -= std::min(pending, n);
    }

    out = split_lines(raw);
    return StatusCode::Ok;
}

std::vector<std::string> AtTransport::split_lines(std::string_view raw)
{
    std::vector<std::string> lines;

    std::size_t start = 0;
    std::size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];
        if (c == '\r' || c == '\n') {
            lines.emplace_back(raw.substr(start, i - start));
            if (c == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') {
                ++i;
            }
            ++i;
            start = i;
            continue;
        }
        ++i;
    }

    if (start < raw.size()) {
        lines.emplace_back(raw.substr(start));
    }

    return lines;
}

} // namespace fonalink::io
