// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/ConfigManager.hxx"
#include <utils/NvsHandle.hxx>

namespace garageSSDP
{
    static constexpr char  TAG[] = "Config";
    static constexpr char  NVS_NAMESPACE[] = CONFIG_GARAGE2SSDP_NVS_NAMESPACE;

    esp_err_t ConfigManager::init() {
        if (initialized) {
            return ESP_OK;
        }
        esp_err_t ret = nvs_flash_init();
        if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
            ESP_LOGW(TAG, "NVS partition was truncated, erasing and re-initializing...");
            if ((ret = nvs_flash_erase()) != ESP_OK) {
                ESP_LOGE(TAG, "NVS erase failed: %s", esp_err_to_name(ret));
                return ret;
            }
            ret = nvs_flash_init();
        }

        if (ret == ESP_OK) {
            initialized = true;
            ESP_LOGI(TAG, "NVS initialized successfully.");
        } else {
            ESP_LOGE(TAG, "NVS init failed: %s", esp_err_to_name(ret));
        }
        return ret;
    }

    esp_err_t ConfigManager::load() {
        std::lock_guard<std::mutex> lock(config_mutex);

        const utils::NvsHandle nvs_handle(NVS_NAMESPACE, NVS_READWRITE);
        if (!nvs_handle) {
            return nvs_handle.openError();
        }
        const nvs_handle_t h = nvs_handle.get();

        esp_err_t err;
        #define GetNVS(func, key, out, def) \
        if ((err = func(h, key, out, def)) != ESP_OK) return err;

        GetNVS(getString, "wifi_ssid", config_cache.wifi_ssid, CONFIG_GARAGE2SSDP_WIFI_SSID);
        GetNVS(getString, "wifi_pass", config_cache.wifi_password, CONFIG_GARAGE2SSDP_WIFI_PASSWORD);

        uint32_t http_port = 0;
        GetNVS(getU32, "http_port", http_port, CONFIG_GARAGE2SSDP_HTTP_PORT);
        if (http_port == 0 || http_port > UINT16_MAX) {
            ESP_LOGW(TAG, "Invalid http_port %lu, using %d", static_cast<unsigned long>(http_port), CONFIG_GARAGE2SSDP_HTTP_PORT);
            http_port = CONFIG_GARAGE2SSDP_HTTP_PORT;
        }
        config_cache.http_port = static_cast<uint16_t>(http_port);

        GetNVS(getU32, "device_index", config_cache.device_index, CONFIG_GARAGE2SSDP_DEVICE_INDEX);
        GetNVS(getU32, "poll_interval_s", config_cache.poll_interval_s, CONFIG_GARAGE2SSDP_POLL_INTERVAL_S);
        if (config_cache.poll_interval_s == 0 || config_cache.poll_interval_s > MAX_POLL_INTERVAL_S) {
            ESP_LOGW(TAG, "Polling interval of %lu s is invalid, using %d s",
                     static_cast<unsigned long>(config_cache.poll_interval_s), CONFIG_GARAGE2SSDP_POLL_INTERVAL_S);
            config_cache.poll_interval_s = CONFIG_GARAGE2SSDP_POLL_INTERVAL_S;
        }
        GetNVS(getI32, "sensor_pin", config_cache.sensor_pin, CONFIG_GARAGE2SSDP_SENSOR_PIN);

        GetNVS(getU32, "notify_tmo_ms", config_cache.notify_timeout_ms, CONFIG_GARAGE2SSDP_NOTIFY_TIMEOUT_MS);
        GetNVS(getFlag, "notify_expect", config_cache.notify_expect_no_response, true);

        GetNVS(getFlag, "debug_log", config_cache.debug_logging, false);
        GetNVS(getString, "syslog_srv", config_cache.syslog_server, CONFIG_GARAGE2SSDP_SYSLOG_DEFAULT_SERVER);
        GetNVS(getFlag, "syslog_en", config_cache.syslog_enabled, !config_cache.syslog_server.empty());

        #undef GetNVS

        uint8_t configured_flag = 0;
        nvs_get_u8(h, "configured", &configured_flag);
        config_cache.configured = (configured_flag == 1);

        ESP_LOGI(TAG, "Configuration loaded successfully (configured: %d).", configured_flag);
        return ESP_OK;
    }

    esp_err_t ConfigManager::writeBasicSettings(const nvs_handle_t handle, const AppConfig& cfg) {
        esp_err_t err;
        #define SetNVS(func, key, value, ...) \
        if ((err = func(handle, key, value, ##__VA_ARGS__)) != ESP_OK) return err;
        SetNVS(setString, "wifi_ssid", cfg.wifi_ssid);
        SetNVS(setString, "wifi_pass", cfg.wifi_password);
        SetNVS(nvs_set_u32, "http_port", cfg.http_port);
        SetNVS(nvs_set_u32, "device_index", cfg.device_index);
        SetNVS(nvs_set_u32, "poll_interval_s", cfg.poll_interval_s);
        SetNVS(nvs_set_i32, "sensor_pin", cfg.sensor_pin);
        SetNVS(nvs_set_u32, "notify_tmo_ms", cfg.notify_timeout_ms);
        SetNVS(nvs_set_u8, "notify_expect", cfg.notify_expect_no_response ? 1 : 0);
        SetNVS(nvs_set_u8, "debug_log", cfg.debug_logging ? 1 : 0);
        SetNVS(setString, "syslog_srv", cfg.syslog_server);
        SetNVS(nvs_set_u8, "syslog_en", cfg.syslog_enabled ? 1 : 0);
        SetNVS(nvs_set_u8, "configured", 1);
        #undef SetNVS
        return ESP_OK;
    }

    esp_err_t ConfigManager::saveMainConfig(const AppConfig& new_config) {
        std::lock_guard<std::mutex> lock(config_mutex);

        const utils::NvsHandle nvs_handle(NVS_NAMESPACE, NVS_READWRITE);
        if (!nvs_handle) {
            return nvs_handle.openError();
        }

        if (const esp_err_t err = writeBasicSettings(nvs_handle.get(), new_config); err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to write configuration: %s", esp_err_to_name(err));
            return err;
        }
        if (const esp_err_t err = nvs_handle.commit(); err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to commit configuration: %s", esp_err_to_name(err));
            return err;
        }

        config_cache = new_config;
        config_cache.configured = true;
        ESP_LOGI(TAG, "Configuration saved successfully.");
        return ESP_OK;
    }

    AppConfig ConfigManager::getConfig() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config_cache;
    }

    bool ConfigManager::isConfigured() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config_cache.configured;
    }

    esp_err_t ConfigManager::getString(nvs_handle_t handle, const char* key, std::string& out_value, const char* default_value) {
        size_t required_size = 0;
        esp_err_t err = nvs_get_str(handle, key, nullptr, &required_size);

        if (err == ESP_ERR_NVS_NOT_FOUND) {
            out_value = default_value ? default_value : "";
            ESP_LOGW(TAG, "Key '%s' not found in NVS, using default value: '%s'", key, out_value.c_str());
            return ESP_OK;
        }
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Error reading key '%s': %s", key, esp_err_to_name(err));
            return err;
        }
        if (required_size == 0) {
            out_value.clear();
            return ESP_OK;
        }

        std::vector<char> buf(required_size);
        err = nvs_get_str(handle, key, buf.data(), &required_size);
        if (err == ESP_OK) {
            out_value.assign(buf.data(), required_size > 0 ? required_size - 1 : 0);
        }
        return err;
    }

    esp_err_t ConfigManager::setString(const nvs_handle_t handle, const char* key, const std::string& value) {
        return nvs_set_str(handle, key, value.c_str());
    }

    esp_err_t ConfigManager::getU32(const nvs_handle_t handle, const char* key, uint32_t& out_value, const uint32_t default_value) {
        const esp_err_t err = nvs_get_u32(handle, key, &out_value);
        if (err == ESP_ERR_NVS_NOT_FOUND) {
            out_value = default_value;
            ESP_LOGW(TAG, "Key %s not found in NVS, using default value: %lu", key, static_cast<unsigned long>(default_value));
            return ESP_OK;
        }
        return err;
    }

    esp_err_t ConfigManager::getI32(const nvs_handle_t handle, const char* key, int32_t& out_value, const int32_t default_value) {
        const esp_err_t err = nvs_get_i32(handle, key, &out_value);
        if (err == ESP_ERR_NVS_NOT_FOUND) {
            out_value = default_value;
            ESP_LOGW(TAG, "Key %s not found in NVS, using default value: %ld", key, static_cast<long>(default_value));
            return ESP_OK;
        }
        return err;
    }

    esp_err_t ConfigManager::getFlag(const nvs_handle_t handle, const char* key, bool& out_value, const bool default_value) {
        uint8_t flag = 0;
        const esp_err_t err = nvs_get_u8(handle, key, &flag);
        if (err == ESP_ERR_NVS_NOT_FOUND) {
            out_value = default_value;
            return ESP_OK;
        }
        if (err == ESP_OK) {
            out_value = (flag == 1);
        }
        return err;
    }

    cJSON* ConfigManager::getSerializedConfig(const bool mask_passwords) const {
        const AppConfig cfg = getConfig();
        cJSON* root = cJSON_CreateObject();

        cJSON_AddStringToObject(root, "wifi_ssid", cfg.wifi_ssid.c_str());
        cJSON_AddStringToObject(root, "wifi_password", mask_passwords ? "***" : cfg.wifi_password.c_str());
        cJSON_AddNumberToObject(root, "http_port", cfg.http_port);
        cJSON_AddNumberToObject(root, "device_index", cfg.device_index);
        cJSON_AddNumberToObject(root, "poll_interval_s", cfg.poll_interval_s);
        cJSON_AddNumberToObject(root, "sensor_pin", cfg.sensor_pin);
        cJSON_AddBoolToObject(root, "simulation", cfg.simulationMode());
        cJSON_AddNumberToObject(root, "notify_timeout_ms", cfg.notify_timeout_ms);
        cJSON_AddBoolToObject(root, "notify_expect_no_response", cfg.notify_expect_no_response);
        cJSON_AddBoolToObject(root, "debug_logging", cfg.debug_logging);
        cJSON_AddStringToObject(root, "syslog_server", cfg.syslog_server.c_str());
        cJSON_AddBoolToObject(root, "syslog_enabled", cfg.syslog_enabled);

        return root;
    }
}
