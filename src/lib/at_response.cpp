#include "fonalink/modem/at_response.h"

namespace fonalink::modem::at_response {

bool last_line_starts_with_ok(const std::vector<std::string>& lines)
{
    if (lines.empty()) return false;
    const std::string& last = lines.back();
    return last.compare(0, RESULT_OK.size(), RESULT_OK) == 0;
}

bool last_line_is_ok(const std::vector<std::string>& lines)
{
    if (lines.empty()) return false;
    return lines.back() == RESULT_OK;
}

OperatorStatus operator_status(const std::vector<std::string>& lines)
{
    if (lines.size() <= OPERATOR_LINE_INDEX) {
        return OperatorStatus::Unknown;
    }
    if (lines[OPERATOR_LINE_INDEX] == NO_OPERATOR) {
        return OperatorStatus::NotRegistered;
    }
    return OperatorStatus::Registered;
}

std::string describe(const std::vector<std::string>& lines)
{
    std::string out = "[";
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += ", ";
        out += '\'';
        for (char c : lines[i]) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc < 0x20 || uc == 0x7f) {
                static const char* hex = "0123456789abcdef";
                out += "\\x";
                out += hex[uc >> 4];
                out += hex[uc & 0x0f];
            } else {
                out += c;
            }
        }
        out += '\'';
    }
    out += "]";
    return out;
}

} // namespace fonalink::modem::at_response
