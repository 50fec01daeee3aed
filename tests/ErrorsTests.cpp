#include "core/Errors.h"
#include "core/Session.h"

#include <gtest/gtest.h>

using namespace facilitator::core;

TEST(Errors, WireNamesRoundTrip) {
    for (auto code : {ErrorCode::Authentication, ErrorCode::RoomFull, ErrorCode::Capacity,
                      ErrorCode::RetryLimit, ErrorCode::Protocol}) {
        auto parsed = error_code_from_name(error_code_name(code));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, code);
    }
    EXPECT_FALSE(error_code_from_name("bogus"));
}

TEST(Errors, ThrowErrorRaisesTheTypedError) {
    EXPECT_THROW(throw_error(ErrorCode::RoomFull, "full"), RoomFullError);
    EXPECT_THROW(throw_error(ErrorCode::Capacity, "busy"), CapacityError);

    try {
        throw_error(ErrorCode::NotMember, "nope");
        FAIL() << "throw_error returned";
    } catch (const FacilitatorError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotMember);
        EXPECT_STREQ(e.what(), "nope");
    }
}

TEST(SessionName, IsTrimmedCappedAndDefaulted) {
    EXPECT_EQ(sanitize_name("  Ada  "), "Ada");
    EXPECT_EQ(sanitize_name("   "), "guest");
    EXPECT_EQ(sanitize_name(""), "guest");

    const std::string longName(40, 'x');
    EXPECT_EQ(sanitize_name(longName).size(), Session::kMaxNameLen);
}
