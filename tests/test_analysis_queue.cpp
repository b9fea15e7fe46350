#include <catch2/catch_test_macros.hpp>
#include "analysis/analysis_queue.hpp"
#include "core/slow_query_report.hpp"

#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace querywatch;

TEST_CASE("AnalysisQueue: FIFO for a single producer", "[queue]") {
    AnalysisQueue<int> queue;
    for (int i = 0; i < 5; ++i) {
        CHECK(queue.push(i));
    }
    CHECK(queue.size() == 5);

    for (int i = 0; i < 5; ++i) {
        auto v = queue.try_pop();
        REQUIRE(v.has_value());
        CHECK(*v == i);
    }
    CHECK_FALSE(queue.try_pop().has_value());
    CHECK(queue.empty());
}

TEST_CASE("AnalysisQueue: drain takes at most max items in order", "[queue]") {
    AnalysisQueue<int> queue;
    for (int i = 0; i < 25; ++i) {
        queue.push(i);
    }

    std::vector<int> batch;
    CHECK(queue.drain(batch, 10) == 10);
    REQUIRE(batch.size() == 10);
    CHECK(batch.front() == 0);
    CHECK(batch.back() == 9);
    CHECK(queue.size() == 15);

    batch.clear();
    CHECK(queue.drain(batch, 100) == 15);
    CHECK(batch.front() == 10);
    CHECK(queue.empty());
}

TEST_CASE("AnalysisQueue: unbounded by default", "[queue]") {
    AnalysisQueue<int> queue;
    for (int i = 0; i < 10000; ++i) {
        REQUIRE(queue.push(i));
    }
    CHECK(queue.size() == 10000);
    CHECK(queue.dropped_count() == 0);
}

TEST_CASE("AnalysisQueue: max depth drops new items", "[queue]") {
    AnalysisQueue<int> queue(3);
    CHECK(queue.push(1));
    CHECK(queue.push(2));
    CHECK(queue.push(3));
    CHECK_FALSE(queue.push(4));
    CHECK(queue.size() == 3);
    CHECK(queue.dropped_count() == 1);

    // Oldest items are kept
    auto first = queue.try_pop();
    REQUIRE(first.has_value());
    CHECK(*first == 1);

    // Room again after a pop
    CHECK(queue.push(5));
}

namespace {

struct FragilePayload {
    int value = 0;
    bool throw_on_move = false;

    FragilePayload(int v, bool fragile) : value(v), throw_on_move(fragile) {}
    FragilePayload(FragilePayload&& other) : value(other.value), throw_on_move(other.throw_on_move) {
        if (throw_on_move) throw std::runtime_error("move failed");
    }
    FragilePayload& operator=(FragilePayload&&) = default;
};

} // anonymous namespace

TEST_CASE("AnalysisQueue: failed push keeps its depth budget", "[queue]") {
    AnalysisQueue<FragilePayload> queue(1);

    CHECK_THROWS_AS(queue.push(FragilePayload{1, true}), std::runtime_error);
    CHECK(queue.size() == 0);
    CHECK(queue.empty());

    CHECK(queue.push(FragilePayload{2, false}));
    CHECK(queue.size() == 1);
    CHECK(queue.dropped_count() == 0);

    auto out = queue.try_pop();
    REQUIRE(out.has_value());
    CHECK(out->value == 2);
}

TEST_CASE("AnalysisQueue: carries move-only payloads", "[queue]") {
    AnalysisQueue<AnalysisItem> queue;
    AnalysisItem item;
    item.report.query_id = "q1";
    item.report.raw_query = "SELECT 1";
    queue.push(std::move(item));

    auto out = queue.try_pop();
    REQUIRE(out.has_value());
    CHECK(out->report.query_id == "q1");
}

TEST_CASE("AnalysisQueue: concurrent producers lose nothing", "[queue][concurrency]") {
    AnalysisQueue<int> queue;
    constexpr int kProducers = 8;
    constexpr int kPerProducer = 2000;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.push(p * kPerProducer + i);
            }
        });
    }

    std::set<int> seen;
    std::vector<int> batch;
    size_t expected = static_cast<size_t>(kProducers) * kPerProducer;
    while (seen.size() < expected) {
        batch.clear();
        queue.drain(batch, 64);
        seen.insert(batch.begin(), batch.end());
        if (batch.empty()) std::this_thread::yield();
    }
    for (auto& t : producers) t.join();

    CHECK(seen.size() == expected);
    CHECK(queue.pushed_count() == expected);
    CHECK(queue.empty());
}
