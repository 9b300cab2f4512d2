#pragma once

#include <cstdint>

namespace fonalink::io {

// Result of a transport-level operation.
enum class StatusCode : std::uint8_t
{
    Ok = 0,
    InvalidRequest,
    NotReady,       // no handle open
    IOError,        // short write, failed flush
    OpenFailed,     // port could not be acquired (includes unsupported baud rates)
};

const char* to_string(StatusCode status) noexcept;

} // namespace fonalink::io
