#include "pipeline/BoundedQueue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "TestSupport.hpp"

using namespace StatTrack;

TEST(BoundedQueueTest, KeepsOrderAcrossProducers) {
	Pipeline::BoundedQueue<int> queue(8);

	std::thread a([&] {
		for (int i = 0; i < 500; ++i)
			queue.push(i);
	});
	std::thread b([&] {
		for (int i = 1000; i < 1500; ++i)
			queue.push(i);
	});

	int lastA = -1;
	int lastB = 999;
	for (int n = 0; n < 1000; ++n) {
		auto item = queue.pop();
		ASSERT_TRUE(item.has_value());
		if (*item < 1000) {
			EXPECT_GT(*item, lastA);
			lastA = *item;
		} else {
			EXPECT_GT(*item, lastB);
			lastB = *item;
		}
	}
	a.join();
	b.join();
	EXPECT_EQ(lastA, 499);
	EXPECT_EQ(lastB, 1499);
}

TEST(BoundedQueueTest, PushBlocksWhileFull) {
	Pipeline::BoundedQueue<int> queue(2);
	ASSERT_TRUE(queue.push(1));
	ASSERT_TRUE(queue.push(2));

	std::atomic<bool> pushed{false};
	std::thread producer([&] {
		queue.push(3);
		pushed = true;
	});

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	EXPECT_FALSE(pushed.load());
	EXPECT_EQ(queue.size(), 2u);

	EXPECT_EQ(queue.pop().value(), 1);
	EXPECT_TRUE(Testing::waitFor([&] { return pushed.load(); }));
	producer.join();
	EXPECT_EQ(queue.size(), 2u);
}

TEST(BoundedQueueTest, CloseDrainsThenEnds) {
	Pipeline::BoundedQueue<int> queue(4);
	queue.push(7);
	queue.push(8);
	queue.close();

	EXPECT_FALSE(queue.push(9));
	EXPECT_EQ(queue.pop().value(), 7);
	EXPECT_EQ(queue.pop().value(), 8);
	EXPECT_FALSE(queue.pop().has_value());
	EXPECT_TRUE(queue.closed());
}

TEST(BoundedQueueTest, CloseReleasesBlockedProducerAndConsumer) {
	Pipeline::BoundedQueue<int> full(1);
	full.push(1);
	std::atomic<int> pushResult{-1};
	std::thread producer([&] { pushResult = full.push(2) ? 1 : 0; });

	Pipeline::BoundedQueue<int> empty(1);
	std::atomic<bool> popEnded{false};
	std::thread consumer([&] {
		auto item = empty.pop();
		popEnded = !item.has_value();
	});

	std::this_thread::sleep_for(std::chrono::milliseconds(20));
	full.close();
	empty.close();
	producer.join();
	consumer.join();

	EXPECT_EQ(pushResult.load(), 0);
	EXPECT_TRUE(popEnded.load());
}

TEST(BoundedQueueTest, PopForTimesOut) {
	Pipeline::BoundedQueue<int> queue(1);
	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(queue.popFor(std::chrono::milliseconds(30)).has_value());
	EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
	EXPECT_FALSE(queue.closed());
}

TEST(BoundedQueueTest, ZeroCapacityMeansOne) {
	Pipeline::BoundedQueue<int> queue(0);
	EXPECT_EQ(queue.capacity(), 1u);
}
