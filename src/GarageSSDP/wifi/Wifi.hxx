// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_WIFI_HXX
#define GARAGESSDP_WIFI_HXX

#include <esp_wifi.h>
#include <esp_netif.h>

namespace garageSSDP
{
    class Wifi {
    public:
        enum class Status {
            DISCONNECTED,
            CONNECTING,
            CONNECTED
        };

        Wifi(const Wifi&) = delete;
        Wifi& operator=(const Wifi&) = delete;

        static Wifi& Instance() {
            static Wifi instance;
            return instance;
        }

        // Network stack, default event loop and Wi-Fi driver.
        esp_err_t init();

        esp_err_t connectToAP(const std::string& ssid, const std::string& password);

        void disconnect();

        [[nodiscard]] Status getStatus() const { return status; }
        [[nodiscard]] std::string getIpAddress() const;

        // Called from the default event loop task.
        std::function<void(void)> onConnected;
        std::function<void(void)> onDisconnected;

    private:
        Wifi() = default;

        static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

        std::atomic<Status> status{Status::DISCONNECTED};
        uint32_t retry_count{0};
        bool initialized{false};
        esp_netif_t* sta_netif{nullptr};
    };
} // garageSSDP

#endif //GARAGESSDP_WIFI_HXX
