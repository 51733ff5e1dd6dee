// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/ConfigManager.hxx"
#include "system/AppController.hxx"

static constexpr char  TAG[] = "garage2ssdp";

extern "C" void app_main(void) {
    ESP_LOGI(TAG, "Garage2SSDP door sensor v.%s starting...", GARAGESSDP_VERSION);

    auto& config = garageSSDP::ConfigManager::Instance();
    ESP_ERROR_CHECK(config.init());
    ESP_ERROR_CHECK(config.load());

    if (!config.isConfigured()) {
        ESP_LOGI(TAG, "First boot, storing build defaults.");
        ESP_ERROR_CHECK(config.saveMainConfig(config.getConfig()));
    }

    if (cJSON* serialized = config.getSerializedConfig(); serialized) {
        if (char* text = cJSON_PrintUnformatted(serialized); text) {
            ESP_LOGI(TAG, "Configuration: %s", text);
            cJSON_free(text);
        }
        cJSON_Delete(serialized);
    }

    ESP_ERROR_CHECK(garageSSDP::AppController::Instance().start(config.getConfig()));

    ESP_LOGI(TAG, "Application setup complete. Logic running in background tasks.");
}
