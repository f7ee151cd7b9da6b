#include <catch2/catch_test_macros.hpp>

#include "scheduler/timer_queue.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("TimerQueue", "[scheduler]") {
    TimerQueue q;
    auto t0 = TimerQueue::Clock::now();
    std::vector<std::string> fired;
    auto run = [&](std::vector<TimerQueue::Task> tasks) {
        for (auto& t : tasks) t();
    };

    SECTION("EmptyHasNoDeadline") {
        REQUIRE(q.empty());
        REQUIRE_FALSE(q.next_deadline().has_value());
        REQUIRE(q.pop_due(t0 + 1h).empty());
    }

    SECTION("FiresInDeadlineOrder") {
        q.add(t0 + 30ms, [&] { fired.push_back("c"); });
        q.add(t0 + 10ms, [&] { fired.push_back("a"); });
        q.add(t0 + 20ms, [&] { fired.push_back("b"); });

        REQUIRE(q.next_deadline() == t0 + 10ms);
        run(q.pop_due(t0 + 20ms));
        REQUIRE(fired == std::vector<std::string>{"a", "b"});
        REQUIRE(q.size() == 1);

        run(q.pop_due(t0 + 30ms));
        REQUIRE(fired.back() == "c");
        REQUIRE(q.empty());
    }

    SECTION("EqualDeadlinesKeepInsertionOrder") {
        q.add(t0 + 5ms, [&] { fired.push_back("first"); });
        q.add(t0 + 5ms, [&] { fired.push_back("second"); });
        run(q.pop_due(t0 + 5ms));
        REQUIRE(fired == std::vector<std::string>{"first", "second"});
    }

    SECTION("CancelRemovesTimer") {
        auto a = q.add(t0 + 10ms, [&] { fired.push_back("a"); });
        q.add(t0 + 20ms, [&] { fired.push_back("b"); });

        REQUIRE(q.cancel(a));
        REQUIRE_FALSE(q.cancel(a));
        REQUIRE(q.next_deadline() == t0 + 20ms);

        run(q.pop_due(t0 + 1s));
        REQUIRE(fired == std::vector<std::string>{"b"});
    }

    SECTION("CancelAfterFireFails") {
        auto a = q.add(t0, [&] { fired.push_back("a"); });
        run(q.pop_due(t0));
        REQUIRE_FALSE(q.cancel(a));
    }
}
