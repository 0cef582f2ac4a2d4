#include "common/error.hpp"

#include <gtest/gtest.h>

using namespace sublocator;

TEST(ErrorKindTest, ToString) {
    EXPECT_EQ(error_kind_to_string(ErrorKind::NotAString), "NotAString");
    EXPECT_EQ(error_kind_to_string(ErrorKind::InvalidAtMost), "InvalidAtMost");
    EXPECT_EQ(error_kind_to_string(ErrorKind::InvalidStart), "InvalidStart");
    EXPECT_EQ(error_kind_to_string(ErrorKind::PatternError), "PatternError");
}

TEST(LocateErrorTest, MakeFormatsMessage) {
    auto err = LocateError::make(ErrorKind::InvalidAtMost, "got {} instead of {}", -3, "all");
    EXPECT_EQ(err.kind, ErrorKind::InvalidAtMost);
    EXPECT_EQ(err.message, "got -3 instead of all");
}

TEST(FormatErrorTest, KindAndMessage) {
    LocateError err{ErrorKind::PatternError, "literal set must not be empty"};
    EXPECT_EQ(format_error(err), "PatternError: literal set must not be empty");
}
