// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_APPCONTROLLER_HXX
#define GARAGESSDP_APPCONTROLLER_HXX

#include "system/ConfigManager.hxx"
#include "device/DoorState.hxx"
#include "notify/SubscriptionRegistry.hxx"
#include "notify/Notifier.hxx"
#include "loop/DeviceLoop.hxx"
#include "monitor/GarageMonitor.hxx"
#include "status/StatusEndpoint.hxx"
#include "ssdp/DiscoveryResponder.hxx"

namespace garageSSDP
{
    class AppController {
        public:
            AppController(const AppController&) = delete;
            AppController& operator=(const AppController&) = delete;

            static AppController& Instance() {
                static AppController instance;
                return instance;
            }

            esp_err_t start(const AppConfig& config);

            // Leaves the multicast group and stops the HTTP server. Safe to call twice.
            void stop();

            static std::unique_ptr<SensorReader> makeSensorReader(int32_t sensor_pin);

        private:
            AppController() = default;

            esp_err_t initMonitor();
            void initNetworkSubsystem();
            void startNetworkServices();

            // Callbacks
            void onNetworkConnected();
            void onNetworkDisconnected();

            static void ShutdownHandler();

            AppConfig m_config{};
            std::unique_ptr<DeviceIdentity> m_identity;
            DoorStateCell m_state;
            SubscriptionRegistry m_registry;
            DeviceLoop m_loop;
            std::unique_ptr<SensorReader> m_reader;
            std::unique_ptr<Notifier> m_notifier;
            std::unique_ptr<GarageMonitor> m_monitor;
            std::unique_ptr<StatusEndpoint> m_endpoint;
            std::unique_ptr<DiscoveryResponder> m_responder;

            bool m_services_started{false};
    };
} // garageSSDP

#endif //GARAGESSDP_APPCONTROLLER_HXX
