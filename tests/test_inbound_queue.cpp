#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "broadcast/inbound_queue.h"

TEST(InboundQueue, PopsInPushOrder) {
    InboundQueue queue;
    queue.push("a");
    queue.push("b");
    queue.push("c");

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop(), "a");
    EXPECT_EQ(queue.pop(), "b");
    EXPECT_EQ(queue.pop(), "c");
}

TEST(InboundQueue, CloseDrainsThenEnds) {
    InboundQueue queue;
    queue.push("last");
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push("rejected"));
    EXPECT_EQ(queue.pop(), "last");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(InboundQueue, CloseWakesBlockedConsumer) {
    InboundQueue queue;
    std::thread consumer([&] { EXPECT_FALSE(queue.pop().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();
}

TEST(InboundQueue, ManyProducersLoseNothingAndKeepPerProducerOrder) {
    InboundQueue queue;
    constexpr int kProducers = 8;
    constexpr int kPerProducer = 1000;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i)
                queue.push(std::to_string(p) + ":" + std::to_string(i));
        });
    }

    std::map<int, int> next;
    for (int n = 0; n < kProducers * kPerProducer; ++n) {
        auto msg = queue.pop();
        ASSERT_TRUE(msg.has_value());
        auto colon = msg->find(':');
        int producer = std::stoi(msg->substr(0, colon));
        int seq = std::stoi(msg->substr(colon + 1));
        EXPECT_EQ(seq, next[producer]);
        next[producer] = seq + 1;
    }

    for (auto& t : producers)
        t.join();
    EXPECT_EQ(queue.size(), 0u);
    for (int p = 0; p < kProducers; ++p)
        EXPECT_EQ(next[p], kPerProducer);
}
