#include "doctest.h"

#include "fonalink/modem/at_response.h"

#include <string>
#include <vector>

using namespace fonalink::modem::at_response;

using Lines = std::vector<std::string>;

TEST_CASE("last_line_starts_with_ok is a prefix match")
{
    CHECK(last_line_starts_with_ok(Lines{"AT", "", "OK"}));
    CHECK(last_line_starts_with_ok(Lines{"OK "}));
    CHECK(last_line_starts_with_ok(Lines{"OKAY"}));
    CHECK_FALSE(last_line_starts_with_ok(Lines{"OK", "ERROR"}));
    CHECK_FALSE(last_line_starts_with_ok(Lines{" OK"}));
    CHECK_FALSE(last_line_starts_with_ok(Lines{}));
}

TEST_CASE("last_line_is_ok is an exact match")
{
    CHECK(last_line_is_ok(Lines{"AT+CMGF=1", "", "OK"}));
    CHECK_FALSE(last_line_is_ok(Lines{"OK "}));
    CHECK_FALSE(last_line_is_ok(Lines{"ERROR"}));
    CHECK_FALSE(last_line_is_ok(Lines{}));
}

TEST_CASE("operator_status reads the fixed line position")
{
    CHECK(operator_status(Lines{"AT+COPS?", "", "+COPS: 0", "", "OK"}) == OperatorStatus::NotRegistered);
    CHECK(operator_status(Lines{"AT+COPS?", "", "+COPS: 0,0,\"Proximus\"", "", "OK"}) == OperatorStatus::Registered);

    // Without the blank line the status shifts to index 1 and index 2 is "OK".
    CHECK(operator_status(Lines{"AT+COPS?", "+COPS: 0", "OK"}) == OperatorStatus::Registered);

    CHECK(operator_status(Lines{"AT+COPS?", "OK"}) == OperatorStatus::Unknown);
    CHECK(operator_status(Lines{}) == OperatorStatus::Unknown);
}

TEST_CASE("describe escapes control bytes")
{
    CHECK(describe(Lines{}) == "[]");
    CHECK(describe(Lines{"AT", "", "OK"}) == "['AT', '', 'OK']");
    CHECK(describe(Lines{"hi\x1a"}) == "['hi\\x1a']");
}
