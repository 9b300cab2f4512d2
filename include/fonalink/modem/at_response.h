#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fonalink::modem::at_response {

// Final result marker emitted by the module.
inline constexpr std::string_view RESULT_OK = "OK";

// Operator status line reported by AT+COPS? when no carrier is registered.
inline constexpr std::string_view NO_OPERATOR = "+COPS: 0";

// Position of the operator status line in an AT+COPS? response
// (echo, blank, status, blank, OK).
inline constexpr std::size_t OPERATOR_LINE_INDEX = 2;

// Presence check for "AT": last line begins with "OK".
bool last_line_starts_with_ok(const std::vector<std::string>& lines);

// Command check: last line is exactly "OK".
bool last_line_is_ok(const std::vector<std::string>& lines);

enum class OperatorStatus {
    Registered,
    NotRegistered,
    Unknown, // response too short to carry a status line
};

// Reads the operator status from a fixed line position. Extra informational
// lines from the module shift the position and defeat this check.
OperatorStatus operator_status(const std::vector<std::string>& lines);

// Renders lines as ['a', 'b'] for logging.
std::string describe(const std::vector<std::string>& lines);

} // namespace fonalink::modem::at_response
