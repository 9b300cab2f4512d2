#pragma once

#include "fonalink/io/core/channel.h"

#include <cstdint>
#include <memory>
#include <string>

namespace fonalink::platform::posix {

// Opens a serial device node in raw 8N1 mode at the given baud rate.
// Returns nullptr on failure with the OS cause in `error`.
std::unique_ptr<fonalink::io::Channel>
open_serial_channel(const std::string& port, std::uint32_t baud, std::string& error);

// Channel factory backed by open_serial_channel().
class SerialChannelFactory final : public fonalink::io::IChannelFactory {
public:
    std::unique_ptr<fonalink::io::Channel> open(const std::string& port,
                                                std::uint32_t baud,
                                                std::string& error) override;
};

} // namespace fonalink::platform::posix
