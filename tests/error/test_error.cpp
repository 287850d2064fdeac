#include <gtest/gtest.h>

#include <string>

#include "clipvault/error/error.hpp"

using namespace clipvault;

TEST(ErrorCodeTest, CategoryAndMessages) {
    std::error_code ec = ErrorCode::StoreWriteFailed;
    EXPECT_EQ(ec.category().name(), std::string("clipvault"));
    EXPECT_FALSE(ec.message().empty());
    EXPECT_EQ(ec, make_error_code(ErrorCode::StoreWriteFailed));
    EXPECT_NE(ec, make_error_code(ErrorCode::StoreReadFailed));
}

TEST(ErrorCodeTest, ExceptionsCarryTheirCode) {
    try {
        throw StoreException(ErrorCode::BlobWriteFailed, "disk full");
    } catch (const ClipVaultException& e) {
        EXPECT_EQ(e.code(), make_error_code(ErrorCode::BlobWriteFailed));
        EXPECT_NE(std::string(e.what()).find("disk full"), std::string::npos);
    }

    MigrationException migration("version 9");
    EXPECT_EQ(migration.code(), make_error_code(ErrorCode::MigrationFailed));

    ConfigException config("bad value");
    EXPECT_EQ(config.code(), make_error_code(ErrorCode::ConfigInvalid));
}

TEST(ResultTest, HoldsValue) {
    Result<int> result(42);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(result.value_or(7), 42);
}

TEST(ResultTest, HoldsError) {
    Result<std::string> result(ErrorCode::NotFound);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(ErrorCode::NotFound));
    EXPECT_EQ(result.value_or("fallback"), "fallback");
    EXPECT_THROW((void)result.value(), ClipVaultException);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());
    EXPECT_NO_THROW(ok.value());

    Result<void> failed(ErrorCode::ClipboardWriteFailed);
    EXPECT_FALSE(failed.has_value());
    EXPECT_THROW(failed.value(), ClipVaultException);
}
