#pragma once

#include "fonalink/io/core/channel.h"
#include "fonalink/io/core/status.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fonalink::io {

// AtTransport: line-oriented adapter over a serial Channel.
// - write_line() appends CR, writes and flushes.
// - read_lines() takes a snapshot of whatever is buffered right now and
//   splits it into lines. It never waits for more bytes.
class AtTransport {
public:
    explicit AtTransport(IChannelFactory& factory);
    ~AtTransport();

    AtTransport(const AtTransport&) = delete;
    AtTransport& operator=(const AtTransport&) = delete;

    StatusCode open(const std::string& port, std::uint32_t baud);
    void close() noexcept;
    bool is_open() const noexcept { return static_cast<bool>(_channel); }

    StatusCode write_line(std::string_view line);
    StatusCode read_lines(std::vector<std::string>& out);

    // Cause of the last failed operation (empty after success).
    const std::string& last_error() const noexcept { return _lastError; }

    // Universal-newline split: "\r\n", "\r" and "\n" each end a line.
    // A trailing terminator does not yield an extra empty line.
    static std::vector<std::string> split_lines(std::string_view raw);

private:
    static constexpr std::size_t READ_CHUNK = 256;

    IChannelFactory& _factory;
    std::unique_ptr<Channel> _channel;
    std::string _lastError;
};

} // namespace fonalink::io
