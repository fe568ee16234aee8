#include <gtest/gtest.h>
#include <layout_chunker/thread_pool.h>
#include <atomic>
#include <chrono>
#include <string>

using layout_chunker::ThreadPool;

TEST(ThreadPoolTest, ZeroThreadsUsesHardware) {
    ThreadPool pool(0);
    EXPECT_GE(pool.thread_count(), 1u);

    ThreadPool fixed(3);
    EXPECT_EQ(fixed.thread_count(), 3u);
}

TEST(ThreadPoolTest, ReturnsResultsInSubmissionSlots) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.enqueue([i]() { return i * i; }));
    }

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ForwardsArguments) {
    ThreadPool pool(2);
    auto future = pool.enqueue([](const std::string& name, int pages) {
        return name + ":" + std::to_string(pages);
    }, std::string("report.pdf"), 12);

    EXPECT_EQ(future.get(), "report.pdf:12");
}

TEST(ThreadPoolTest, WaitAllDrainsQueue) {
    ThreadPool pool(2);
    std::atomic<int> completed{0};

    for (int i = 0; i < 6; ++i) {
        pool.enqueue([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            completed++;
        });
    }

    pool.wait_all();
    EXPECT_EQ(completed.load(), 6);
    EXPECT_EQ(pool.queue_size(), 0u);
    EXPECT_EQ(pool.active_tasks(), 0u);
}

TEST(ThreadPoolTest, CountsQueuedAndRunningTasks) {
    ThreadPool pool(1);
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    pool.enqueue([&started, gate]() {
        started.set_value();
        gate.wait();
    });
    for (int i = 0; i < 3; ++i) {
        pool.enqueue([]() {});
    }

    started.get_future().wait();
    EXPECT_EQ(pool.active_tasks(), 1u);
    EXPECT_EQ(pool.queue_size(), 3u);

    release.set_value();
    pool.wait_all();
    EXPECT_EQ(pool.active_tasks(), 0u);
    EXPECT_EQ(pool.queue_size(), 0u);
}

TEST(ThreadPoolTest, ExceptionTravelsThroughFuture) {
    ThreadPool pool(2);

    auto future = pool.enqueue([]() -> int {
        throw std::runtime_error("document failed");
    });
    auto healthy = pool.enqueue([]() { return 7; });

    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(healthy.get(), 7);
}

TEST(ThreadPoolTest, DifferentReturnTypes) {
    ThreadPool pool(2);

    auto int_future = pool.enqueue([]() { return 42; });
    auto string_future = pool.enqueue([]() { return std::string("hello"); });
    auto void_future = pool.enqueue([]() {});

    EXPECT_EQ(int_future.get(), 42);
    EXPECT_EQ(string_future.get(), "hello");
    EXPECT_NO_THROW(void_future.get());
}

TEST(ThreadPoolTest, DestructorFinishesPendingWork) {
    std::atomic<int> completed{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 8; ++i) {
            pool.enqueue([&completed]() { completed++; });
        }
    }
    EXPECT_EQ(completed.load(), 8);
}
