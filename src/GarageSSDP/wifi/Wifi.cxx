// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <esp_netif.h>
#include <esp_system.h>
#include <lwip/ip4_addr.h>
#include "wifi/Wifi.hxx"

namespace garageSSDP
{
    static constexpr char  TAG[] = "WifiManager";

    esp_err_t Wifi::init() {
        if (initialized) {
            return ESP_OK;
        }

        ESP_ERROR_CHECK(esp_netif_init());
        if (const esp_err_t err = esp_event_loop_create_default(); err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
            ESP_LOGE(TAG, "Failed to create default event loop: %s", esp_err_to_name(err));
            return err;
        }

        wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
        ESP_ERROR_CHECK(esp_wifi_init(&cfg));

        ESP_ERROR_CHECK(esp_event_handler_instance_register(WIFI_EVENT,
                                                            ESP_EVENT_ANY_ID,
                                                            &wifiEventHandler,
                                                            this,
                                                            nullptr));
        ESP_ERROR_CHECK(esp_event_handler_instance_register(IP_EVENT,
                                                            IP_EVENT_STA_GOT_IP,
                                                            &wifiEventHandler,
                                                            this,
                                                            nullptr));

        initialized = true;
        ESP_LOGI(TAG, "WiFi Manager initialized.");
        return ESP_OK;
    }

    esp_err_t Wifi::connectToAP(const std::string& ssid, const std::string& password) {
        if (!initialized) {
            return ESP_ERR_INVALID_STATE;
        }
        status = Status::CONNECTING;
        retry_count = 0;
        if (!sta_netif) {
            sta_netif = esp_netif_create_default_wifi_sta();
        }

        wifi_config_t wifi_config = {};
        strncpy(reinterpret_cast<char*>(wifi_config.sta.ssid), ssid.c_str(), sizeof(wifi_config.sta.ssid) - 1);
        strncpy(reinterpret_cast<char*>(wifi_config.sta.password), password.c_str(), sizeof(wifi_config.sta.password) - 1);

        ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));
        ESP_ERROR_CHECK(esp_wifi_set_config(WIFI_IF_STA, &wifi_config));
        ESP_ERROR_CHECK(esp_wifi_start());

        ESP_LOGI(TAG, "Connecting to AP SSID: %s", ssid.c_str());
        return ESP_OK;
    }

    void Wifi::disconnect() {
        esp_wifi_disconnect();
        esp_wifi_stop();
        status = Status::DISCONNECTED;
    }

    std::string Wifi::getIpAddress() const {
        if (status != Status::CONNECTED || !sta_netif) {
            return "0.0.0.0";
        }
        esp_netif_ip_info_t ip_info;
        if (esp_netif_get_ip_info(sta_netif, &ip_info) != ESP_OK) {
            return "0.0.0.0";
        }
        return ip4addr_ntoa(reinterpret_cast<const ip4_addr_t*>(&ip_info.ip));
    }

    void Wifi::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
        auto* manager = static_cast<Wifi*>(arg);

        if (event_base == WIFI_EVENT && event_id == WIFI_EVENT_STA_START) {
            ESP_LOGI(TAG, "STA_START: connecting...");
            esp_wifi_connect();
        } else if (event_base == WIFI_EVENT && event_id == WIFI_EVENT_STA_DISCONNECTED) {
            const bool was_connected = manager->status == Status::CONNECTED;
            manager->status = Status::DISCONNECTED;
            if (was_connected && manager->onDisconnected) manager->onDisconnected();

            manager->retry_count++;
            if (manager->retry_count >= CONFIG_GARAGE2SSDP_WIFI_MAX_RETRY) {
                ESP_LOGE(TAG, "WiFi connection failed after %lu attempts. Restarting.",
                         static_cast<unsigned long>(manager->retry_count));
                esp_restart();
            }
            ESP_LOGW(TAG, "STA_DISCONNECTED: attempt %lu of %d. Retrying...",
                     static_cast<unsigned long>(manager->retry_count), CONFIG_GARAGE2SSDP_WIFI_MAX_RETRY);
            esp_wifi_connect();
        } else if (event_base == IP_EVENT && event_id == IP_EVENT_STA_GOT_IP) {
            auto const* event = static_cast<ip_event_got_ip_t*>(event_data);
            ESP_LOGI(TAG, "GOT_IP: " IPSTR, IP2STR(&event->ip_info.ip));

            manager->retry_count = 0;
            manager->status = Status::CONNECTED;
            if (manager->onConnected) manager->onConnected();
        }
    }
} // garageSSDP
