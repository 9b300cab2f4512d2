#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace fonalink::io {

// Abstract byte-level I/O channel (serial TTY, UART, test fakes).
class Channel {
public:
    virtual ~Channel() = default;

    // Number of bytes that can be read right now without blocking.
    virtual std::size_t available() = 0;

    // Read up to maxLen bytes into buffer.
    // Returns the number of bytes actually read (0 if none).
    virtual std::size_t read(std::uint8_t* buffer, std::size_t maxLen) = 0;

    // Write len bytes from buffer.
    // Returns the number of bytes accepted; less than len means the write failed.
    virtual std::size_t write(const std::uint8_t* buffer, std::size_t len) = 0;

    // Block until everything written has been transmitted.
    virtual bool flush() = 0;
};

// Opens channels by port name. Platform code provides the real one; tests
// provide scripted fakes.
class IChannelFactory {
public:
    virtual ~IChannelFactory() = default;

    // Returns nullptr on failure and fills `error` with the cause.
    virtual std::unique_ptr<Channel> open(const std::string& port,
                                          std::uint32_t baud,
                                          std::string& error) = 0;
};

} // namespace fonalink::io
