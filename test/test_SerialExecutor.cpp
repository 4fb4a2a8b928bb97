#define BOOST_TEST_MODULE test_SerialExecutor
#include <boost/test/unit_test.hpp>

#include "serial_executor.h"
#include <future>
#include <stdexcept>
#include <vector>

using namespace metricpub;

BOOST_AUTO_TEST_CASE(tasks_run_in_submission_order) {
    SerialExecutor executor("test", 100);
    std::vector<int> order;

    for (int i = 0; i < 50; ++i) {
        BOOST_REQUIRE(executor.try_submit([&order, i]() { order.push_back(i); }));
    }
    BOOST_CHECK(executor.shutdown(std::chrono::seconds(5)));
    executor.shutdown_now();

    BOOST_REQUIRE_EQUAL(order.size(), 50);
    for (int i = 0; i < 50; ++i) {
        BOOST_CHECK_EQUAL(order[i], i);
    }
}

BOOST_AUTO_TEST_CASE(full_queue_rejects_submissions) {
    SerialExecutor executor("test", 2);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    BOOST_REQUIRE(executor.try_submit([gate, &started]() {
        started.set_value();
        gate.wait();
    }));
    started.get_future().wait();

    BOOST_CHECK(executor.try_submit([]() {}));
    BOOST_CHECK(executor.try_submit([]() {}));
    BOOST_CHECK(!executor.try_submit([]() {}));
    BOOST_CHECK_EQUAL(executor.pending(), 2);

    release.set_value();
    BOOST_CHECK(executor.shutdown(std::chrono::seconds(5)));
    BOOST_CHECK_EQUAL(executor.pending(), 0);
}

BOOST_AUTO_TEST_CASE(no_submissions_after_shutdown) {
    SerialExecutor executor("test", 10);
    BOOST_CHECK(executor.is_accepting());
    BOOST_CHECK(executor.shutdown(std::chrono::seconds(1)));
    BOOST_CHECK(!executor.is_accepting());
    BOOST_CHECK(!executor.try_submit([]() {}));
}

BOOST_AUTO_TEST_CASE(shutdown_times_out_on_a_stuck_task) {
    SerialExecutor executor("test", 10);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    BOOST_REQUIRE(executor.try_submit([gate]() { gate.wait(); }));
    BOOST_CHECK(!executor.shutdown(std::chrono::milliseconds(50)));

    release.set_value();
    executor.shutdown_now();
}

BOOST_AUTO_TEST_CASE(shutdown_now_discards_queued_tasks) {
    SerialExecutor executor("test", 10);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;
    int ran = 0;

    BOOST_REQUIRE(executor.try_submit([gate, &started]() {
        started.set_value();
        gate.wait();
    }));
    started.get_future().wait();
    for (int i = 0; i < 5; ++i) {
        BOOST_REQUIRE(executor.try_submit([&ran]() { ++ran; }));
    }

    std::thread releaser([&release]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        release.set_value();
    });
    executor.shutdown_now();
    releaser.join();

    BOOST_CHECK_EQUAL(ran, 0);
    BOOST_CHECK_EQUAL(executor.pending(), 0);
}

BOOST_AUTO_TEST_CASE(failing_task_does_not_stop_the_worker) {
    SerialExecutor executor("test", 10);
    bool ran_after = false;

    BOOST_REQUIRE(executor.try_submit([]() { throw std::runtime_error("boom"); }));
    BOOST_REQUIRE(executor.try_submit([&ran_after]() { ran_after = true; }));
    BOOST_CHECK(executor.shutdown(std::chrono::seconds(5)));

    BOOST_CHECK(ran_after);
}
