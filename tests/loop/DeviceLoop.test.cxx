// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include <freertos/semphr.h>
#include "loop/DeviceLoop.hxx"

using namespace garageSSDP;

static void test_post_before_init_is_rejected() {
    const DeviceLoop loop;
    TEST_ASSERT_FALSE(loop.isRunning());
    TEST_ASSERT_FALSE(loop.post([]() {}));
}

static void test_work_runs_in_order_on_loop_task() {
    DeviceLoop loop;
    TEST_ASSERT_EQUAL(ESP_OK, loop.init());
    TEST_ASSERT_EQUAL(ESP_OK, loop.init());
    TEST_ASSERT_FALSE(loop.isLoopTask());

    SemaphoreHandle_t done = xSemaphoreCreateBinary();
    std::vector<int> order;
    bool on_loop = true;

    for (int i = 0; i < 5; ++i) {
        TEST_ASSERT_TRUE(loop.post([&order, &on_loop, &loop, i]() {
            order.push_back(i);
            on_loop = on_loop && loop.isLoopTask();
        }));
    }
    TEST_ASSERT_TRUE(loop.post([done]() { xSemaphoreGive(done); }));

    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(done, pdMS_TO_TICKS(1000)));
    vSemaphoreDelete(done);

    TEST_ASSERT_EQUAL(5, order.size());
    for (int i = 0; i < 5; ++i) {
        TEST_ASSERT_EQUAL(i, order[i]);
    }
    TEST_ASSERT_TRUE(on_loop);
}

static void test_full_queue_drops_work() {
    DeviceLoop loop;
    TEST_ASSERT_EQUAL(ESP_OK, loop.init(2));

    SemaphoreHandle_t gate = xSemaphoreCreateBinary();
    TEST_ASSERT_TRUE(loop.post([gate]() { xSemaphoreTake(gate, portMAX_DELAY); }));
    vTaskDelay(pdMS_TO_TICKS(20));

    TEST_ASSERT_TRUE(loop.post([]() {}));
    TEST_ASSERT_TRUE(loop.post([]() {}));
    TEST_ASSERT_FALSE(loop.post([]() {}));

    xSemaphoreGive(gate);
    vTaskDelay(pdMS_TO_TICKS(20));
    vSemaphoreDelete(gate);
}

void run_device_loop_tests() {
    RUN_TEST(test_post_before_init_is_rejected);
    RUN_TEST(test_work_runs_in_order_on_loop_task);
    RUN_TEST(test_full_queue_drops_work);
}
