// SPDX-License-Identifier: Apache-2.0
#include <core/RecurringTask.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "TestSupport.hpp"

using namespace chatvox;
using namespace chatvox::test;

TEST_CASE("RecurringTask runs repeatedly until stopped", "[task]")
{
    auto count = std::atomic<int> { 0 };
    auto task = RecurringTask("counter", std::chrono::milliseconds(1), [&] { ++count; });

    CHECK(!task.isRunning());
    task.start();
    CHECK(task.isRunning());
    REQUIRE(waitFor([&] { return count.load() >= 3; }));

    task.stop();
    CHECK(!task.isRunning());
    auto const stopped = count.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(count.load() == stopped);
    CHECK(task.iterations() == static_cast<std::uint64_t>(stopped));
}

TEST_CASE("RecurringTask wake cuts the wait short", "[task]")
{
    auto count = std::atomic<int> { 0 };
    auto task = RecurringTask("sleeper", std::chrono::hours(1), [&] { ++count; });
    task.start();
    REQUIRE(waitFor([&] { return count.load() == 1; }));

    task.wake();
    REQUIRE(waitFor([&] { return count.load() == 2; }));
    task.stop();
}

TEST_CASE("RecurringTask never overlaps with itself", "[task]")
{
    auto active = std::atomic<int> { 0 };
    auto overlapped = std::atomic<bool> { false };
    auto runs = std::atomic<int> { 0 };
    auto task = RecurringTask("slow", std::chrono::milliseconds(0), [&] {
        if (++active > 1)
            overlapped = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
        ++runs;
    });

    task.start();
    REQUIRE(waitFor([&] { return runs.load() >= 5; }));
    task.wake();
    task.wake();
    task.stop();
    CHECK(!overlapped.load());
}

TEST_CASE("RecurringTask survives exceptions", "[task]")
{
    auto count = std::atomic<int> { 0 };
    auto task = RecurringTask("thrower", std::chrono::milliseconds(1), [&] {
        ++count;
        throw std::runtime_error("boom");
    });

    task.start();
    REQUIRE(waitFor([&] { return count.load() >= 2; }));
    task.stop();
}
