#include <gtest/gtest.h>
#include "latmon/core/result.h"
#include "latmon/core/error.h"
#include <memory>
#include <string>
#include <vector>

namespace latmon {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorCarriesMessageAndCode) {
    auto result = Result<int>::error("limit must be between 1 and 10, got 0", Error::Code::QUERY_FAILURE);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "limit must be between 1 and 10, got 0");
    EXPECT_EQ(result.error_code(), Error::Code::QUERY_FAILURE);
}

TEST(ResultTest, ErrorCodeDefaultsToUnknown) {
    auto result = Result<std::string>::error("something");
    EXPECT_EQ(result.error_code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, FromErrorException) {
    Result<int> result(StorageError("disk full"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "disk full");
    EXPECT_EQ(result.error_code(), Error::Code::COMMIT_FAILURE);
}

TEST(ResultTest, VectorResult) {
    std::vector<int> vec = {1, 2, 3, 4, 5};
    Result<std::vector<int>> result(vec);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value().size(), 5u);
    EXPECT_EQ(result.value()[0], 1);
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));

    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, MoveAssignmentKeepsError) {
    Result<std::string> target("value");
    target = Result<std::string>::error("failed", Error::Code::INTERNAL);
    EXPECT_FALSE(target.ok());
    EXPECT_EQ(target.error_code(), Error::Code::INTERNAL);
}

TEST(ResultTest, TakeValueOfMoveOnlyType) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result.ok());
    std::unique_ptr<int> taken = result.take_value();
    ASSERT_TRUE(taken);
    EXPECT_EQ(*taken, 7);
}

TEST(ResultTest, AccessingWrongSideThrows) {
    auto failed = Result<int>::error("nope");
    EXPECT_THROW(failed.value(), std::runtime_error);
    EXPECT_THROW(failed.take_value(), std::runtime_error);

    Result<int> succeeded(1);
    EXPECT_THROW(succeeded.error(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> result;
    EXPECT_TRUE(result.ok());
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, VoidErrorResult) {
    auto result = Result<void>::error("Retention failed", Error::Code::RETENTION_FAILURE);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "Retention failed");
    EXPECT_EQ(result.error_code(), Error::Code::RETENTION_FAILURE);
}

} // namespace
} // namespace core
} // namespace latmon
