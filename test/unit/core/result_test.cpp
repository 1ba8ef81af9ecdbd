#include <gtest/gtest.h>
#include "bitsdb/core/result.h"
#include "bitsdb/core/error.h"
#include <string>
#include <vector>

namespace bitsdb {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.has_error());
    EXPECT_FALSE(result.retryable());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), "Invalid input");
    EXPECT_EQ(result.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ResultTest, DefaultCodeIsUnknown) {
    auto result = Result<std::string>::error("Something happened");
    EXPECT_EQ(result.code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, ConstructFromTypedError) {
    Result<int> validation{ValidationError("bad timestamp")};
    EXPECT_EQ(validation.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(validation.error(), "bad timestamp");

    Result<int> conflict{ConflictError("duplicate")};
    EXPECT_EQ(conflict.code(), Error::Code::ALREADY_EXISTS);

    Result<int> missing{NotFoundError("gone")};
    EXPECT_EQ(missing.code(), Error::Code::NOT_FOUND);

    Result<void> retry{RetryableTransactionError("lock timeout")};
    EXPECT_EQ(retry.code(), Error::Code::ABORTED);
    EXPECT_TRUE(retry.retryable());
}

TEST(ResultTest, RetryableCodes) {
    EXPECT_TRUE(is_retryable(Error::Code::ABORTED));
    EXPECT_TRUE(is_retryable(Error::Code::TIMEOUT));
    EXPECT_FALSE(is_retryable(Error::Code::INVALID_ARGUMENT));
    EXPECT_FALSE(is_retryable(Error::Code::NOT_FOUND));
    EXPECT_FALSE(is_retryable(Error::Code::ALREADY_EXISTS));
    EXPECT_FALSE(is_retryable(Error::Code::INTERNAL));
}

TEST(ResultTest, ErrorFromKeepsMessageAndCode) {
    auto source = Result<std::string>::error("Batch b1 not found", Error::Code::NOT_FOUND);
    auto propagated = Result<std::vector<int>>::error_from(source);
    EXPECT_FALSE(propagated.ok());
    EXPECT_EQ(propagated.error(), "Batch b1 not found");
    EXPECT_EQ(propagated.code(), Error::Code::NOT_FOUND);

    auto as_void = Result<void>::error_from(propagated);
    EXPECT_EQ(as_void.code(), Error::Code::NOT_FOUND);
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));

    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, TakeValue) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    auto values = result.take_value();
    EXPECT_EQ(values.size(), 3u);
}

TEST(ResultTest, VoidResult) {
    Result<void> result;
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.has_error());

    auto failed = Result<void>::error("Internal error", Error::Code::INTERNAL);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.code(), Error::Code::INTERNAL);
}

TEST(ResultTest, ErrorOfOkResultThrows) {
    Result<int> result(1);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(code_name(Error::Code::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_STREQ(code_name(Error::Code::NOT_FOUND), "NOT_FOUND");
    EXPECT_STREQ(code_name(Error::Code::ALREADY_EXISTS), "ALREADY_EXISTS");
    EXPECT_STREQ(code_name(Error::Code::TIMEOUT), "TIMEOUT");
    EXPECT_STREQ(code_name(Error::Code::ABORTED), "ABORTED");
}

TEST(ErrorTest, ValidationErrorIsInvalidArgument) {
    ValidationError error("empty update");
    const InvalidArgumentError& base = error;
    EXPECT_EQ(base.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("empty update"));
}

} // namespace
} // namespace core
} // namespace bitsdb
