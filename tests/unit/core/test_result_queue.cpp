#include "master/ResultQueue.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>

using disagg::master::ResultQueue;

TEST_CASE("ResultQueue drains in order and ends after close", "[farm][queue]")
{
    ResultQueue<int> q;
    q.push(1);
    q.push(2);
    q.close();
    q.push(3); // ignored once closed

    CHECK(q.pop() == 1);
    CHECK(q.pop() == 2);
    CHECK_FALSE(q.pop().has_value());
}

TEST_CASE("ResultQueue feeds a single consumer from many producers", "[farm][queue]")
{
    ResultQueue<int> q(2);
    long sum = 0;
    std::thread consumer(
        [&]
        {
            while (auto v = q.pop())
                sum += *v;
        });

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t)
        producers.emplace_back(
            [&q, t]
            {
                for (int i = 1; i <= 100; ++i)
                    q.push(t * 1000 + i);
            });
    for (auto& p : producers)
        p.join();
    q.close();
    consumer.join();

    // 4 * 5050 + 1000 * (0 + 1 + 2 + 3) * 100
    CHECK(sum == 4 * 5050 + 600000);
    CHECK(q.size() == 0);
}

TEST_CASE("A full ResultQueue blocks the producer", "[farm][queue]")
{
    ResultQueue<int> q(1);
    q.push(1);
    std::thread late(
        [&]
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(25));
            (void) q.pop();
        });
    const auto t0 = std::chrono::steady_clock::now();
    q.push(2);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    late.join();
    REQUIRE(ms >= 20);
    CHECK(q.pop() == 2);
}
