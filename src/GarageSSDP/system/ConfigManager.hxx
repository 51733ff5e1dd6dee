// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_CONFIGMANAGER_HXX
#define GARAGESSDP_CONFIGMANAGER_HXX

namespace garageSSDP
{
    // One day; keeps the poll period in milliseconds within 32 bits.
    static constexpr uint32_t MAX_POLL_INTERVAL_S = 24 * 3600;

    struct AppConfig {
        // WiFi
        std::string wifi_ssid;
        std::string wifi_password;

        // Device
        uint16_t http_port{CONFIG_GARAGE2SSDP_HTTP_PORT};
        uint32_t device_index{CONFIG_GARAGE2SSDP_DEVICE_INDEX};
        uint32_t poll_interval_s{CONFIG_GARAGE2SSDP_POLL_INTERVAL_S};
        int32_t sensor_pin{CONFIG_GARAGE2SSDP_SENSOR_PIN};

        // Notifications
        uint32_t notify_timeout_ms{CONFIG_GARAGE2SSDP_NOTIFY_TIMEOUT_MS};
        bool notify_expect_no_response{true};

        // Logging
        bool debug_logging{false};
        std::string syslog_server;
        bool syslog_enabled{false};

        bool configured{false};

        [[nodiscard]] bool simulationMode() const { return sensor_pin < 0; }
    };

    class ConfigManager {
        public:
            ConfigManager(const ConfigManager&) = delete;
            ConfigManager& operator=(const ConfigManager&) = delete;

            [[nodiscard]] static ConfigManager& Instance() {
                static ConfigManager instance;
                return instance;
            }

            esp_err_t init();

            esp_err_t load();

            esp_err_t saveMainConfig(const AppConfig& new_config);

            [[nodiscard]] AppConfig getConfig() const;

            [[nodiscard]] bool isConfigured() const;

            // Caller owns the returned object (cJSON_Delete).
            [[nodiscard]] cJSON* getSerializedConfig(bool mask_passwords = true) const;

        private:
            ConfigManager() = default;
            esp_err_t writeBasicSettings(nvs_handle_t handle, const AppConfig& cfg);
            static esp_err_t getString(nvs_handle_t handle, const char* key, std::string& out_value, const char* default_value);
            static esp_err_t getU32(nvs_handle_t handle, const char* key, uint32_t& out_value, uint32_t default_value);
            static esp_err_t getI32(nvs_handle_t handle, const char* key, int32_t& out_value, int32_t default_value);
            static esp_err_t getFlag(nvs_handle_t handle, const char* key, bool& out_value, bool default_value);
            static esp_err_t setString(nvs_handle_t handle, const char* key, const std::string& value);

            AppConfig config_cache{};
            mutable std::mutex config_mutex{};
            bool initialized{false};
    };
}


#endif //GARAGESSDP_CONFIGMANAGER_HXX
