#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "common/BoundedQueue.hpp"

using mdi::common::BoundedQueue;
using namespace std::chrono_literals;

namespace {

int fifoAndCapacity() {
    BoundedQueue<int> queue(2);
    CHECK(queue.tryPush(1));
    CHECK(queue.tryPush(2));
    CHECK(!queue.tryPush(3));
    CHECK(queue.size() == 2);
    CHECK(queue.highWater() == 2);

    auto first = queue.pop();
    CHECK(first && *first == 1);
    auto second = queue.popFor(10ms);
    CHECK(second && *second == 2);
    CHECK(!queue.popFor(10ms));
    return 0;
}

int fullQueueBlocksProducer() {
    BoundedQueue<int> queue(1);
    CHECK(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed.store(true);
    });

    std::this_thread::sleep_for(50ms);
    CHECK_MSG(!pushed.load(), "producer should block while the queue is full");

    auto value = queue.pop();
    CHECK(value && *value == 1);
    CHECK(testing_support::waitFor([&]() { return pushed.load(); }, 500ms));
    producer.join();

    auto next = queue.pop();
    CHECK(next && *next == 2);
    return 0;
}

int closeWakesAndDrains() {
    BoundedQueue<std::string> queue(4);
    CHECK(queue.push("a"));

    std::atomic<bool> consumerDone{false};
    BoundedQueue<std::string> empty(1);
    std::thread consumer([&]() {
        auto value = empty.pop();
        consumerDone.store(!value.has_value());
    });
    std::this_thread::sleep_for(20ms);
    empty.close();
    consumer.join();
    CHECK_MSG(consumerDone.load(), "pop on a closed empty queue returns nullopt");

    queue.close();
    CHECK(queue.closed());
    CHECK(!queue.push("b"));
    CHECK(!queue.tryPush("c"));
    auto drained = queue.pop();
    CHECK(drained && *drained == "a");
    CHECK(!queue.pop());
    return 0;
}

int closeReleasesBlockedProducer() {
    BoundedQueue<int> queue(1);
    CHECK(queue.push(1));
    std::atomic<int> result{-1};
    std::thread producer([&]() { result.store(queue.push(2) ? 1 : 0); });
    std::this_thread::sleep_for(20ms);
    queue.close();
    producer.join();
    CHECK(result.load() == 0);
    return 0;
}

int manyProducersKeepEveryItem() {
    BoundedQueue<int> queue(8);
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.push(p * kPerProducer + i);
            }
        });
    }

    long long sum = 0;
    int count = 0;
    while (count < kProducers * kPerProducer) {
        auto value = queue.popFor(1s);
        CHECK_MSG(value.has_value(), "consumer starved at count=" << count);
        sum += *value;
        ++count;
    }
    for (auto& producer : producers) {
        producer.join();
    }

    const long long n = kProducers * kPerProducer;
    CHECK(sum == n * (n - 1) / 2);
    CHECK(queue.highWater() <= queue.capacity());
    return 0;
}

}  // namespace

int main() {
    RUN(fifoAndCapacity);
    RUN(fullQueueBlocksProducer);
    RUN(closeWakesAndDrains);
    RUN(closeReleasesBlockedProducer);
    RUN(manyProducersKeepEveryItem);
    std::cout << "test_bounded_queue passed\n";
    return 0;
}
