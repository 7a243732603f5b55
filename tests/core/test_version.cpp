// test_version.cpp — тест версии библиотеки и общих функций C API

#include <gtest/gtest.h>
#include "meterlink/meterlink_c.h"
#include "meterlink/core.h"

TEST(VersionTest, ReturnsCorrectVersion) {
    const char* version = ml_version();
    ASSERT_NE(version, nullptr);
    EXPECT_STREQ(version, "0.1.0");
}

TEST(VersionTest, VersionMatchesCoreHeader) {
    EXPECT_STREQ(ml_version(), MeterLink::VERSION);
}

TEST(ErrorMessageTest, ReturnsCorrectMessages) {
    EXPECT_STREQ(ml_error_message(ML_OK), "Success");
    EXPECT_STREQ(ml_error_message(ML_ERROR_INVALID_ARGUMENT), "Invalid argument");
    EXPECT_STREQ(ml_error_message(ML_ERROR_NOT_RUNNING), "Server is not running");
    EXPECT_STREQ(ml_error_message(ML_ERROR_NETWORK), "Network error");
    EXPECT_STREQ(ml_error_message(ML_ERROR_NOT_FOUND), "Not found");
    EXPECT_STREQ(ml_error_message(ML_ERROR_INTERNAL), "Internal error");
}

TEST(FreeStringTest, HandlesNull) {
    // Не должен падать при передаче nullptr
    ml_free_string(nullptr);
}

TEST(LogLevelTest, RejectsOutOfRange) {
    EXPECT_EQ(ml_set_log_level(42), ML_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ml_last_error(), ML_ERROR_INVALID_ARGUMENT);

    EXPECT_EQ(ml_set_log_level(2), ML_OK);
    EXPECT_EQ(ml_last_error(), ML_OK);
}

TEST(LastErrorTest, ClearResetsState) {
    ml_set_log_level(-1);
    EXPECT_NE(ml_last_error(), ML_OK);
    EXPECT_STRNE(ml_last_error_message(), "");

    ml_clear_error();
    EXPECT_EQ(ml_last_error(), ML_OK);
    EXPECT_STREQ(ml_last_error_message(), "");
}
