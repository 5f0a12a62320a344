#include <limits>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "errorkit/fault.hpp"
#include "errorkit/options.hpp"

namespace {

    struct OpaquePayload {
        int code = 0;
    };

    template <typename Payload>
    std::string describe_thrown(Payload payload) {
        try {
            throw payload;
        } catch (...) { return errorkit::describe_current_exception(); }
    }

    class FaultCapture : public ::testing::Test {
      protected:
        void TearDown() override {
            errorkit::reset_options();
        }
    };

}

TEST(FaultDescribe, UsesExceptionWhat) {
    EXPECT_EQ(describe_thrown(std::runtime_error("boom")), "boom");
    EXPECT_EQ(describe_thrown(errorkit::Error("typed")), "typed");
}

TEST(FaultDescribe, UsesStringPayloads) {
    EXPECT_EQ(describe_thrown(std::string("owned")), "owned");
    EXPECT_EQ(describe_thrown("literal"), "literal");
}

TEST(FaultDescribe, UsesArithmeticPayloads) {
    EXPECT_EQ(describe_thrown(42), "42");
    EXPECT_EQ(describe_thrown(-7L), "-7");
    EXPECT_EQ(describe_thrown(1.5), "1.5");
    EXPECT_EQ(describe_thrown(true), "true");
    EXPECT_EQ(describe_thrown(static_cast<short>(5)), "5");
    EXPECT_EQ(describe_thrown(static_cast<unsigned short>(6)), "6");
    EXPECT_EQ(describe_thrown(static_cast<signed char>(-3)), "-3");
    EXPECT_EQ(describe_thrown(static_cast<unsigned char>(65)), "65");
    EXPECT_EQ(describe_thrown(2.25L), "2.25");
}

TEST(FaultDescribe, UsesCodeUnitsAsDecimal) {
    EXPECT_EQ(describe_thrown(L'A'), "65");
    EXPECT_EQ(describe_thrown(u8'B'), "66");
    EXPECT_EQ(describe_thrown(u'C'), "67");
    EXPECT_EQ(describe_thrown(U'D'), "68");
    EXPECT_EQ(describe_thrown('x'), "x");
}

TEST(FaultDescribe, FallsBackForUnknownPayloads) {
    EXPECT_EQ(describe_thrown(OpaquePayload{3}), "unknown exception");
}

TEST(FaultDescribe, FallsBackOutsideHandler) {
    EXPECT_EQ(errorkit::describe_current_exception(), "unknown exception");
}

TEST(FaultError, JoinsPayloadAndStack) {
    const auto error = errorkit::make_fault_error("boom", "frame0\nframe1");

    EXPECT_EQ(error.message(), "panic occurred: boom\nStack trace:\nframe0\nframe1");
}

TEST(FaultStack, EmptyForNonPositiveDepth) {
    EXPECT_TRUE(errorkit::capture_stack_trace(0).empty());
    EXPECT_TRUE(errorkit::capture_stack_trace(-1).empty());
}

TEST(FaultStack, CapsFrameCount) {
    const auto trace = errorkit::capture_stack_trace(4);

    ASSERT_FALSE(trace.empty());
    size_t lines = 1;
    for (const char ch : trace) {
        if (ch == '\n') {
            ++lines;
        }
    }
    EXPECT_LE(lines, 4u);
}

TEST_F(FaultCapture, RecoverIncludesPayloadAndTrace) {
    errorkit::Error error("unset");
    try {
        throw std::runtime_error("kaput");
    } catch (...) { error = errorkit::recover_current_exception(); }

    const auto text = error.message();
    EXPECT_TRUE(text.starts_with("panic occurred: kaput\nStack trace:\n"));
    EXPECT_GT(text.size(), std::string("panic occurred: kaput\nStack trace:\n").size());
}

TEST(FaultStack, CapsOversizedFrameCount) {
    const auto trace = errorkit::capture_stack_trace(std::numeric_limits<int>::max());

    EXPECT_FALSE(trace.empty());
}

TEST_F(FaultCapture, RecoverWithClampedFrameCountKeepsPayload) {
    errorkit::configure(errorkit::Options{.max_stack_frames = std::numeric_limits<int>::max()});

    errorkit::Error error("unset");
    try {
        throw std::runtime_error("deep payload");
    } catch (...) { error = errorkit::recover_current_exception(); }

    EXPECT_TRUE(error.message().starts_with("panic occurred: deep payload\nStack trace:\n"));
}

TEST_F(FaultCapture, RecoverHonoursDisabledTrace) {
    errorkit::configure(errorkit::Options{.capture_stack_trace = false});

    errorkit::Error error("unset");
    try {
        throw 5;
    } catch (...) { error = errorkit::recover_current_exception(); }

    EXPECT_EQ(error.message(), "panic occurred: 5\nStack trace:\n<stack trace disabled>");
}
