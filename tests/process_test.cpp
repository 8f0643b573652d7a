#include "autosplit_sdk/host_functions.hpp"
#include "autosplit_sdk/process.hpp"
#include "simulated_host.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstring>
#include <numeric>
#include <optional>
#include <vector>

using autosplit::SimulatedHost;
using autosplit::SimulatedProcess;
using autosplit_sdk::Address;
using autosplit_sdk::HostFunctions;
using autosplit_sdk::MemoryReadError;
using autosplit_sdk::Process;

namespace {

constexpr uint64_t DATA_BASE = 0x1000;
constexpr size_t DATA_SIZE = 16;
constexpr uint64_t LOCKED_BASE = 0x2000;
constexpr uint64_t TEXT_BASE = 0x3000;
constexpr size_t TEXT_SIZE = 300;

class ProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_game = m_host.processes().add("Game.exe", 100);

        std::vector<uint8_t> data(DATA_SIZE);
        std::iota(data.begin(), data.end(), static_cast<uint8_t>(0x10));
        m_data = data;
        ASSERT_TRUE(m_game->add_region(DATA_BASE, data));
        ASSERT_TRUE(m_game->add_region(LOCKED_BASE, std::vector<uint8_t>(8, 0xAA), false));

        std::vector<uint8_t> text(TEXT_SIZE, 'a');
        const char* hello = "hello";
        std::memcpy(text.data(), hello, 6);
        ASSERT_TRUE(m_game->add_region(TEXT_BASE, text));

        m_game->add_module("Game.exe", 0x400000);
        m_game->add_module("engine.dll", 0x7ff00000);

        m_functions.emplace(*m_host.api());
    }

    Process attach() {
        auto process = m_functions->attach("Game.exe");
        EXPECT_TRUE(process.has_value());
        return std::move(*process);
    }

    SimulatedHost m_host;
    SimulatedProcess* m_game = nullptr;
    std::vector<uint8_t> m_data;
    std::optional<HostFunctions> m_functions;
};

} // anonymous namespace

TEST_F(ProcessTest, ReadsScalarInHostByteOrder) {
    Process process = attach();

    auto value = process.read<uint32_t>(Address(DATA_BASE));
    ASSERT_TRUE(value.ok());

    uint32_t expected;
    std::memcpy(&expected, m_data.data(), sizeof(expected));
    EXPECT_EQ(*value, expected);
}

TEST_F(ProcessTest, ReadsFixedSizeArrays) {
    Process process = attach();

    auto bytes = process.read<std::array<uint8_t, 4>>(Address(DATA_BASE + 4));
    ASSERT_TRUE(bytes.ok());
    EXPECT_EQ((*bytes)[0], 0x14);
    EXPECT_EQ((*bytes)[3], 0x17);
}

TEST_F(ProcessTest, ReadSucceedsExactlyWhenRangeIsMapped) {
    Process process = attach();

    // Sweep across both edges of the data region
    for (uint64_t address = DATA_BASE - 4; address < DATA_BASE + DATA_SIZE + 4; ++address) {
        bool inside = address >= DATA_BASE && address + sizeof(uint16_t) <= DATA_BASE + DATA_SIZE;
        auto value = process.read<uint16_t>(Address(address));
        EXPECT_EQ(value.ok(), inside) << "address " << address;
        if (inside && value.ok()) {
            uint16_t expected;
            std::memcpy(&expected, m_data.data() + (address - DATA_BASE), sizeof(expected));
            EXPECT_EQ(*value, expected);
        }
    }
}

TEST_F(ProcessTest, UnmappedAndUnreadableReadsFail) {
    Process process = attach();

    auto unmapped = process.read<uint64_t>(Address(0xDEAD0000));
    ASSERT_FALSE(unmapped.ok());
    EXPECT_EQ(unmapped.error(), MemoryReadError::FailedRead);

    auto locked = process.read<uint8_t>(Address(LOCKED_BASE));
    ASSERT_FALSE(locked.ok());
    EXPECT_EQ(locked.error(), MemoryReadError::FailedRead);

    // Larger than the region
    auto too_big = process.read<std::array<uint8_t, DATA_SIZE + 1>>(Address(DATA_BASE));
    EXPECT_FALSE(too_big.ok());
}

TEST_F(ProcessTest, FailedReadDoesNotInvalidateHandle) {
    Process process = attach();

    EXPECT_FALSE(process.read<uint32_t>(Address(0x10)).ok());
    EXPECT_TRUE(process.read<uint32_t>(Address(DATA_BASE)).ok());
    EXPECT_FALSE(process.read<uint32_t>(Address(LOCKED_BASE)).ok());
    EXPECT_TRUE(process.read<uint8_t>(Address(DATA_BASE + DATA_SIZE - 1)).ok());
}

TEST_F(ProcessTest, EachTypedReadIsOneHostCall) {
    Process process = attach();
    uint64_t before = m_host.get_read_count();

    (void)process.read<uint64_t>(Address(DATA_BASE));
    (void)process.read<uint64_t>(Address(0x10));

    EXPECT_EQ(m_host.get_read_count(), before + 2);
}

TEST_F(ProcessTest, ReadsFailAfterProcessExits) {
    Process process = attach();
    ASSERT_TRUE(process.read<uint32_t>(Address(DATA_BASE)).ok());

    m_game->set_alive(false);
    EXPECT_FALSE(process.read<uint32_t>(Address(DATA_BASE)).ok());
    EXPECT_FALSE(process.read_cstr(Address(TEXT_BASE)).ok());
    EXPECT_FALSE(process.module("Game.exe").has_value());
}

TEST_F(ProcessTest, ReadsFailAfterProcessIsRemoved) {
    Process process = attach();

    ASSERT_TRUE(m_host.processes().remove(100));
    m_game = nullptr;
    EXPECT_FALSE(process.read<uint32_t>(Address(DATA_BASE)).ok());
}

TEST_F(ProcessTest, ReadIntoBuffer) {
    Process process = attach();

    uint8_t buf[8] = {};
    ASSERT_TRUE(process.read_into_buf(Address(DATA_BASE + 8), buf, sizeof(buf)).ok());
    EXPECT_EQ(0, std::memcmp(buf, m_data.data() + 8, sizeof(buf)));

    // Zero-length reads never reach the host
    uint64_t before = m_host.get_read_count();
    EXPECT_TRUE(process.read_into_buf(Address(0), buf, 0).ok());
    EXPECT_EQ(m_host.get_read_count(), before);
}

TEST_F(ProcessTest, ReadsCString) {
    Process process = attach();

    auto text = process.read_cstr(Address(TEXT_BASE));
    ASSERT_TRUE(text.ok());
    EXPECT_EQ(*text, "hello");
}

TEST_F(ProcessTest, CStringWithoutTerminatorFails) {
    Process process = attach();

    // 'a' repeated past MAX_CSTR_LEN
    auto text = process.read_cstr(Address(TEXT_BASE + 8));
    EXPECT_FALSE(text.ok());
}

TEST_F(ProcessTest, ModuleLookup) {
    Process process = attach();

    auto engine = process.module("engine.dll");
    ASSERT_TRUE(engine.has_value());
    EXPECT_EQ(*engine, Address(0x7ff00000));
    EXPECT_FALSE(process.module("missing.dll").has_value());
}

TEST_F(ProcessTest, DestructionDetachesOnce) {
    {
        Process process = attach();
        EXPECT_EQ(m_host.get_attached_count(), 1u);

        Process moved = std::move(process);
        EXPECT_EQ(process.handle(), 0u);
        EXPECT_TRUE(moved.read<uint8_t>(Address(DATA_BASE)).ok());
        EXPECT_FALSE(process.read<uint8_t>(Address(DATA_BASE)).ok());
    }
    EXPECT_EQ(m_host.get_attached_count(), 0u);
    EXPECT_EQ(m_host.get_detach_count(), 1u);
}

TEST_F(ProcessTest, MoveAssignmentDetachesPreviousTarget) {
    Process first = attach();
    Process second = attach();
    EXPECT_EQ(m_host.get_attached_count(), 2u);

    first = std::move(second);
    EXPECT_EQ(m_host.get_attached_count(), 1u);
    EXPECT_EQ(m_host.get_detach_count(), 1u);
}

TEST_F(ProcessTest, ReadsReachAttachedProcessAmongOthers) {
    // Same pid, different contents at the same address
    SimulatedProcess* other = m_host.processes().add("Other.exe", 100);
    std::vector<uint8_t> decoy(DATA_SIZE, 0xEE);
    ASSERT_TRUE(other->add_region(DATA_BASE, decoy));

    Process process = attach();
    auto value = process.read<uint8_t>(Address(DATA_BASE));
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(*value, m_data[0]);

    m_game->set_alive(false);
    EXPECT_FALSE(process.read<uint8_t>(Address(DATA_BASE)).ok());
}
