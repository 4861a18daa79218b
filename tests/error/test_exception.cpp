#include <gtest/gtest.h>

#include <string>

#include "airmon/error/exception.hpp"

namespace airmon::error::test {

TEST(ExceptionTest, RecordsLocationAndMessage) {
    try {
        THROW_RUNTIME_ERROR("bad value ", 42, " for ", std::string("lsusb"));
        FAIL() << "expected an exception";
    } catch (const RuntimeError& ex) {
        EXPECT_EQ(ex.getMessage(), "bad value 42 for lsusb");
        EXPECT_NE(ex.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_GT(ex.getLine(), 0);
        EXPECT_FALSE(ex.getFunction().empty());
        EXPECT_EQ(ex.getThreadId(), std::this_thread::get_id());
    }
}

TEST(ExceptionTest, WhatIncludesDetails) {
    InvalidArgument ex("file.cpp", 7, "parse", "unknown level");
    EXPECT_STREQ(ex.what(), "unknown level [file.cpp:7 in parse()]");
    EXPECT_GT(ex.getStackTrace().frameCount(), 0U);
}

TEST(ExceptionTest, HierarchySupportsNarrowCatches) {
    EXPECT_THROW(THROW_COMMAND_TIMEOUT("slow"), CommandError);
    EXPECT_THROW(THROW_COMMAND_ERROR("missing"), SystemError);
    EXPECT_THROW(THROW_USB_BACKEND_ERROR("no context"), SystemError);
    EXPECT_THROW(THROW_CONFIG_ERROR("bad"), Exception);
    EXPECT_THROW(THROW_NOT_FOUND("gone"), std::exception);
}

TEST(StackTraceTest, CapturesFrames) {
    StackTrace trace;
    EXPECT_GT(trace.frameCount(), 0U);
    EXPECT_FALSE(trace.toString().empty());
}

}  // namespace airmon::error::test
