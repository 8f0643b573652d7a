#include "autosplit_sdk/read_result.hpp"
#include "autosplit_sdk/timer_state.hpp"

#include <gtest/gtest.h>
#include <string>

using autosplit_sdk::BadReadResultAccess;
using autosplit_sdk::MemoryReadError;
using autosplit_sdk::ReadResult;
using autosplit_sdk::TimerState;

TEST(ReadResultTest, HoldsValue) {
    ReadResult<uint32_t> result(314u);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 314u);
    EXPECT_EQ(*result, 314u);
    EXPECT_EQ(result.value_or(0u), 314u);
    EXPECT_EQ(result.to_optional().value(), 314u);
}

TEST(ReadResultTest, HoldsError) {
    ReadResult<uint32_t> result(MemoryReadError::FailedRead);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), MemoryReadError::FailedRead);
    EXPECT_EQ(result.value_or(7u), 7u);
    EXPECT_FALSE(result.to_optional().has_value());
}

TEST(ReadResultTest, ValueOnErrorThrows) {
    ReadResult<std::string> result(MemoryReadError::FailedRead);
    EXPECT_THROW(result.value(), BadReadResultAccess);
}

TEST(ReadResultTest, VoidResult) {
    ReadResult<void> ok;
    EXPECT_TRUE(ok.ok());

    ReadResult<void> failed(MemoryReadError::FailedRead);
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error(), MemoryReadError::FailedRead);
}

TEST(ReadResultTest, ErrorHasName) {
    EXPECT_STREQ(autosplit_sdk::memory_read_error_to_string(MemoryReadError::FailedRead), "failed read");
}

TEST(TimerStateTest, RawValuesMatchHostEncoding) {
    EXPECT_EQ(autosplit_sdk::timer_state_from_raw(0), TimerState::NotRunning);
    EXPECT_EQ(autosplit_sdk::timer_state_from_raw(1), TimerState::Running);
    EXPECT_EQ(autosplit_sdk::timer_state_from_raw(2), TimerState::Paused);
    EXPECT_EQ(autosplit_sdk::timer_state_from_raw(3), TimerState::Ended);
    EXPECT_EQ(autosplit_sdk::timer_state_to_raw(TimerState::Ended), 3u);
}

TEST(TimerStateTest, UnknownRawValueIsNotRunning) {
    EXPECT_EQ(autosplit_sdk::timer_state_from_raw(4), TimerState::NotRunning);
    EXPECT_EQ(autosplit_sdk::timer_state_from_raw(0xFFFFFFFF), TimerState::NotRunning);
}

TEST(TimerStateTest, Names) {
    EXPECT_STREQ(autosplit_sdk::timer_state_to_string(TimerState::Paused), "Paused");
    EXPECT_STREQ(autosplit_sdk::timer_state_to_string(TimerState::NotRunning), "NotRunning");
}
