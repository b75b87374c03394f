#include <unity.h>

#include "system/TaskScheduler.h"

#include <vector>

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

using owlink::system::TaskScheduler;

static void test_periodic_task_rearms() {
    TaskScheduler scheduler;
    int runs = 0;
    const auto id = scheduler.schedule("tick", 100, 50, 0, [&](uint64_t) { ++runs; });

    scheduler.service(99);
    TEST_ASSERT_EQUAL_INT(0, runs);
    scheduler.service(100);
    TEST_ASSERT_EQUAL_INT(1, runs);
    scheduler.service(120);
    TEST_ASSERT_EQUAL_INT(1, runs);
    scheduler.service(150);
    TEST_ASSERT_EQUAL_INT(2, runs);
    TEST_ASSERT_TRUE(scheduler.active(id));

    scheduler.cancel(id);
    scheduler.service(500);
    TEST_ASSERT_EQUAL_INT(2, runs);
    TEST_ASSERT_FALSE(scheduler.active(id));
}

static void test_one_shot_removed_before_run() {
    TaskScheduler scheduler;
    TaskScheduler::TaskId id = TaskScheduler::kInvalidTask;
    bool activeInside = true;
    id = scheduler.schedule("once", 10, 0, 0, [&](uint64_t) { activeInside = scheduler.active(id); });

    scheduler.service(10);
    TEST_ASSERT_FALSE(activeInside);
    TEST_ASSERT_EQUAL_UINT(0, scheduler.size());
}

static void test_cancel_all_from_callback() {
    TaskScheduler scheduler;
    std::vector<int> order;
    scheduler.schedule("first", 0, 100, 0, [&](uint64_t) {
        order.push_back(1);
        scheduler.cancelAll();
    });
    scheduler.schedule("second", 0, 100, 0, [&](uint64_t) { order.push_back(2); });

    scheduler.service(0);
    TEST_ASSERT_EQUAL_UINT(1, order.size());
    TEST_ASSERT_EQUAL_INT(1, order[0]);
    TEST_ASSERT_EQUAL_UINT(0, scheduler.size());
}

static void test_nested_service_is_ignored() {
    TaskScheduler scheduler;
    int outer = 0;
    int inner = 0;
    scheduler.schedule("outer", 0, 10, 0, [&](uint64_t now) {
        ++outer;
        scheduler.service(now + 1000);
    });
    scheduler.schedule("inner", 500, 10, 0, [&](uint64_t) { ++inner; });

    scheduler.service(0);
    TEST_ASSERT_EQUAL_INT(1, outer);
    TEST_ASSERT_EQUAL_INT(0, inner);
}

static void test_empty_task_rejected() {
    TaskScheduler scheduler;
    TEST_ASSERT_EQUAL_UINT32(TaskScheduler::kInvalidTask, scheduler.schedule("none", 0, 0, 0, nullptr));
    TEST_ASSERT_FALSE(scheduler.active(TaskScheduler::kInvalidTask));
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_periodic_task_rearms);
    RUN_TEST(test_one_shot_removed_before_run);
    RUN_TEST(test_cancel_all_from_callback);
    RUN_TEST(test_nested_service_is_ignored);
    RUN_TEST(test_empty_task_rejected);
    return UNITY_END();
}
