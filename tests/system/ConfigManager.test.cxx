// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "system/ConfigManager.hxx"

using namespace garageSSDP;

static void test_config_init_and_defaults() {
    auto& cm = ConfigManager::Instance();
    TEST_ASSERT_EQUAL(ESP_OK, cm.init());

    TEST_ASSERT_EQUAL(ESP_OK, cm.load());

    const AppConfig cfg = cm.getConfig();
    TEST_ASSERT_TRUE(cfg.http_port > 0);
    TEST_ASSERT_TRUE(cfg.poll_interval_s > 0);
    TEST_ASSERT_EQUAL(cfg.sensor_pin < 0, cfg.simulationMode());
}

static void test_config_save_load_cycle() {
    auto& cm = ConfigManager::Instance();
    const AppConfig original = cm.getConfig();

    AppConfig testConfig = original;
    testConfig.wifi_ssid = "TEST_UNIT_SSID";
    testConfig.http_port = 8181;
    testConfig.device_index = 3;
    testConfig.poll_interval_s = 12;
    testConfig.sensor_pin = 4;
    testConfig.notify_expect_no_response = false;

    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(testConfig));
    TEST_ASSERT_TRUE(cm.isConfigured());

    TEST_ASSERT_EQUAL(ESP_OK, cm.load());

    const AppConfig loaded = cm.getConfig();
    TEST_ASSERT_EQUAL_STRING("TEST_UNIT_SSID", loaded.wifi_ssid.c_str());
    TEST_ASSERT_EQUAL_UINT16(8181, loaded.http_port);
    TEST_ASSERT_EQUAL_UINT32(3, loaded.device_index);
    TEST_ASSERT_EQUAL_UINT32(12, loaded.poll_interval_s);
    TEST_ASSERT_EQUAL_INT32(4, loaded.sensor_pin);
    TEST_ASSERT_FALSE(loaded.notify_expect_no_response);
    TEST_ASSERT_TRUE(loaded.configured);

    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(original));
}

static void test_zero_interval_falls_back_to_default() {
    auto& cm = ConfigManager::Instance();
    const AppConfig original = cm.getConfig();

    AppConfig broken = original;
    broken.poll_interval_s = 0;
    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(broken));
    TEST_ASSERT_EQUAL(ESP_OK, cm.load());
    TEST_ASSERT_EQUAL_UINT32(CONFIG_GARAGE2SSDP_POLL_INTERVAL_S, cm.getConfig().poll_interval_s);

    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(original));
}

static void test_oversized_interval_falls_back_to_default() {
    auto& cm = ConfigManager::Instance();
    const AppConfig original = cm.getConfig();

    AppConfig broken = original;
    broken.poll_interval_s = 5000000;
    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(broken));
    TEST_ASSERT_EQUAL(ESP_OK, cm.load());
    TEST_ASSERT_EQUAL_UINT32(CONFIG_GARAGE2SSDP_POLL_INTERVAL_S, cm.getConfig().poll_interval_s);

    broken.poll_interval_s = MAX_POLL_INTERVAL_S;
    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(broken));
    TEST_ASSERT_EQUAL(ESP_OK, cm.load());
    TEST_ASSERT_EQUAL_UINT32(MAX_POLL_INTERVAL_S, cm.getConfig().poll_interval_s);

    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(original));
}

static void test_serialized_config_masks_password() {
    auto& cm = ConfigManager::Instance();
    const AppConfig original = cm.getConfig();

    AppConfig secret = original;
    secret.wifi_password = "hunter22";
    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(secret));

    cJSON* masked = cm.getSerializedConfig();
    TEST_ASSERT_NOT_NULL(masked);
    TEST_ASSERT_EQUAL_STRING("***", cJSON_GetObjectItem(masked, "wifi_password")->valuestring);
    TEST_ASSERT_EQUAL(secret.http_port, cJSON_GetObjectItem(masked, "http_port")->valueint);
    cJSON_Delete(masked);

    cJSON* plain = cm.getSerializedConfig(false);
    TEST_ASSERT_EQUAL_STRING("hunter22", cJSON_GetObjectItem(plain, "wifi_password")->valuestring);
    cJSON_Delete(plain);

    TEST_ASSERT_EQUAL(ESP_OK, cm.saveMainConfig(original));
}

void run_config_manager_tests() {
    RUN_TEST(test_config_init_and_defaults);
    RUN_TEST(test_config_save_load_cycle);
    RUN_TEST(test_zero_interval_falls_back_to_default);
    RUN_TEST(test_oversized_interval_falls_back_to_default);
    RUN_TEST(test_serialized_config_masks_password);
}
