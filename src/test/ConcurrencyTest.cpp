#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <mutex>
#include <set>
#include "application/AsyncTaskManager.hpp"
#include "application/DropOldestQueue.hpp"
#include "application/PriceResolver.hpp"
#include "infrastructure/PriceCache.hpp"
#include "infrastructure/ShellUtils.hpp"
#include "test/TestDoubles.hpp"

using namespace bidlens;

void TestConcurrentResolveSearchesOnce() {
    std::cout << "[Test] Starting concurrent resolve stress test..." << std::endl;

    auto search = std::make_shared<test::FakeSoldListingSearch>();
    search->answerAll(test::Comparables({40, 42, 45, 48, 50, 52, 55}));
    // Long enough that every thread arrives while the first search is in flight.
    search->delay = std::chrono::milliseconds(50);

    application::PriceResolver resolver(std::make_shared<infrastructure::PriceCache>(), search);

    const int NUM_THREADS = 16;
    std::vector<std::thread> threads;
    std::atomic<int> withData{0};

    std::cout << "[Test] Spawning " << NUM_THREADS << " threads resolving one identity..." << std::endl;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&resolver, &withData]() {
            auto snapshot = resolver.resolve(test::TroutIdentity());
            if (snapshot.count == 7) withData++;
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    std::cout << "[Test] Search calls: " << search->callCount() << std::endl;
    assert(search->callCount() == 1);
    assert(withData == NUM_THREADS);
    std::cout << "[PASS] One search served every concurrent caller." << std::endl;
}

void TestTaskManagerWaitForIdle() {
    std::cout << "[Test] AsyncTaskManager drains submitted tasks..." << std::endl;
    application::AsyncTaskManager manager;
    std::atomic<int> done{0};

    for (int i = 0; i < 8; ++i) {
        manager.SubmitTask("sleep " + std::to_string(i), [&done](std::shared_ptr<application::TaskStatus>) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            done++;
        });
    }
    auto failing = manager.SubmitTask("failing", [](std::shared_ptr<application::TaskStatus>) {
        throw std::runtime_error("boom");
    });

    assert(manager.WaitForIdle(std::chrono::seconds(5)));
    assert(done == 8);
    assert(failing->isCompleted);
    assert(failing->failed);
    assert(failing->errorMessage == "boom");
    std::cout << "[PASS] All tasks completed, failure recorded." << std::endl;
}

void TestDropOldestQueueUnderContention() {
    std::cout << "[Test] DropOldestQueue never exceeds capacity..." << std::endl;
    application::DropOldestQueue<int> queue(4);

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < 100; ++i) queue.push(p * 1000 + i);
        });
    }
    for (auto& t : producers) t.join();

    assert(queue.size() == 4);
    assert(queue.droppedCount() == 396);

    queue.close();
    assert(!queue.push(7));
    std::size_t drained = 0;
    while (queue.pop(std::chrono::milliseconds(10))) drained++;
    assert(drained == 4);
    assert(!queue.pop(std::chrono::milliseconds(10)).has_value());
    std::cout << "[PASS] Capacity held, drops counted." << std::endl;
}

void TestTempPathsUniqueAcrossThreads() {
    std::cout << "[Test] Temp image paths never collide across threads..." << std::endl;
    std::mutex mutex;
    std::set<std::string> paths;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                auto path = infrastructure::ShellUtils::UniqueTempPath(".png");
                std::lock_guard<std::mutex> lock(mutex);
                paths.insert(path);
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(paths.size() == 8 * 200);

    assert(infrastructure::ShellUtils::Quote("it's") == "'it'\\''s'");
    assert(infrastructure::ShellUtils::Capture("printf abc").output == "abc");
    assert(infrastructure::ShellUtils::Capture("exit 3").exitCode == 3);
    std::cout << "[PASS] Temp image paths never collide across threads" << std::endl;
}

int main() {
    TestConcurrentResolveSearchesOnce();
    TestTaskManagerWaitForIdle();
    TestDropOldestQueueUnderContention();
    TestTempPathsUniqueAcrossThreads();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
