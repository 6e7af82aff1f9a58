// identity
#include "gscope/listing.hpp"

// stdc++
#include <array>
#include <atomic>
#include <chrono>
#include <thread>

// gtest
#include <gtest/gtest.h>

// application
#include "fake_process.hpp"
#include "gscope/settings.hpp"

using namespace gscope;
using namespace gscope_test;

//--------------------------------------------------------------------------------------------------

namespace {

//--------------------------------------------------------------------------------------------------

constexpr std::uint64_t allgs_k{0x20000};
constexpr std::uint64_t allgs_base_k{0x21000};
constexpr std::uint64_t g1_k{0x30000};
constexpr std::uint64_t g3_k{0x31000};
constexpr std::uint64_t g4_k{0x32000};

struct ListingTest : public ::testing::Test {
    void SetUp() override {
        _types = add_runtime_types(_bi);

        const auto& g_ptr = _bi._types.pointer_to(*_types._g, 8);
        _bi._globals["runtime.allgs"] = {allgs_k, &_bi._types.slice_of(g_ptr, 8)};

        // g1, a null slot, an unreadable g3, then g4
        _mem.put_slice(allgs_k, allgs_base_k, 4, 8);
        _mem.put<std::uint64_t>(allgs_base_k, g1_k);
        _mem.put<std::uint64_t>(allgs_base_k + 8, 0);
        _mem.put<std::uint64_t>(allgs_base_k + 16, g3_k);
        _mem.put<std::uint64_t>(allgs_base_k + 24, g4_k);

        g_image image;
        image._goid = 1;
        image._status = 2;
        put_g(_mem, g1_k, image);

        image._goid = 3;
        put_g(_mem, g3_k, image);
        _mem.erase(g3_k + g_sched_k, 8);

        image._goid = 4;
        image._status = 4;
        put_g(_mem, g4_k, image);
    }

    void TearDown() override { settings::instance() = settings(); }

    fake_memory _mem;
    fake_binary_info _bi;
    runtime_types _types;
};

//--------------------------------------------------------------------------------------------------

// Forwards to another reader and records the most reads ever in flight at once.
struct overlap_counting_memory : memory_reader {
    explicit overlap_counting_memory(memory_reader& base) : _base{base} {}

    void read_memory(std::span<std::byte> buffer, std::uint64_t address) override {
        const int now = ++_in_flight;
        int seen = _max_in_flight.load();
        while (now > seen && !_max_in_flight.compare_exchange_weak(seen, now)) {
        }

        // widen the window so overlapping readers are caught
        std::this_thread::sleep_for(std::chrono::microseconds(50));

        try {
            _base.read_memory(buffer, address);
        } catch (...) {
            --_in_flight;
            throw;
        }

        --_in_flight;
    }

    memory_reader& _base;
    std::atomic<int> _in_flight{0};
    std::atomic<int> _max_in_flight{0};
};

//--------------------------------------------------------------------------------------------------

void expect_listing(const std::vector<goroutine>& gs) {
    ASSERT_EQ(gs.size(), 3);

    EXPECT_FALSE(gs[0].unreadable());
    EXPECT_EQ(gs[0]._id, 1);
    EXPECT_EQ(gs[0]._thread_id, 9);

    EXPECT_TRUE(gs[1].unreadable());
    ASSERT_TRUE(gs[1]._variable);
    EXPECT_EQ(gs[1]._variable->addr(), allgs_base_k + 16);
    EXPECT_FALSE(gs[1]._thread_id);

    EXPECT_FALSE(gs[2].unreadable());
    EXPECT_EQ(gs[2]._id, 4);
    EXPECT_EQ(gs[2]._status, g_status::waiting);
    EXPECT_FALSE(gs[2]._thread_id);
}

//--------------------------------------------------------------------------------------------------

} // namespace

//--------------------------------------------------------------------------------------------------

TEST_F(ListingTest, ListsEveryGoroutine) {
    fake_thread running(9, _mem, _bi);
    running._regs._g_addr = g1_k;
    fake_thread idle(10, _mem, _bi);
    idle._regs._g_addr = 0;

    std::array<thread*, 2> threads{&running, &idle};
    expect_listing(goroutines(_mem, _bi, threads));
}

TEST_F(ListingTest, ParallelListingMatches) {
    settings::instance()._parallel_processing = true;

    fake_thread running(9, _mem, _bi);
    running._regs._g_addr = g1_k;

    serialized_memory mem(_mem);
    std::array<thread*, 1> threads{&running};
    expect_listing(goroutines(mem, _bi, threads));
}

TEST_F(ListingTest, ParallelListingNeverOverlapsReads) {
    settings::instance()._parallel_processing = true;

    // the threads and the listing share one process, so every read lands on `counting`.
    overlap_counting_memory counting(_mem);

    fake_thread running(9, counting, _bi);
    running._regs._g_addr = g1_k;
    fake_thread other(10, counting, _bi);
    other._regs._g_addr = g4_k;
    fake_thread idle(11, counting, _bi);
    idle._regs._tls = 0x90000; // unmapped, resolving it fails

    serialized_memory mem(counting);
    std::array<thread*, 3> threads{&running, &other, &idle};
    auto gs = goroutines(mem, _bi, threads);

    EXPECT_EQ(counting._max_in_flight.load(), 1);
    EXPECT_EQ(counting._in_flight.load(), 0);

    ASSERT_EQ(gs.size(), 3);
    EXPECT_EQ(gs[0]._thread_id, 9);
    EXPECT_TRUE(gs[1].unreadable());
    EXPECT_EQ(gs[2]._thread_id, 10);
}

TEST_F(ListingTest, WithoutThreads) {
    auto gs = goroutines(_mem, _bi);
    ASSERT_EQ(gs.size(), 3);
    EXPECT_FALSE(gs[0]._thread_id);
}

TEST_F(ListingTest, HonorsGoroutineLimit) {
    settings::instance()._max_goroutines = 2;

    auto gs = goroutines(_mem, _bi);
    ASSERT_EQ(gs.size(), 1);
    EXPECT_EQ(gs[0]._id, 1);
}

TEST_F(ListingTest, MissingAllgsThrows) {
    _bi._globals.clear();
    EXPECT_THROW(goroutines(_mem, _bi), std::runtime_error);
}

TEST_F(ListingTest, UnreadableAllgsThrows) {
    _mem.erase(allgs_k, 24);
    EXPECT_THROW(goroutines(_mem, _bi), memory_error);
}

//--------------------------------------------------------------------------------------------------
