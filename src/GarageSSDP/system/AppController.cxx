// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <esp_system.h>
#include "system/AppController.hxx"
#include "system/SyslogConfig.hxx"
#include "sensor/GpioSensorReader.hxx"
#include "sensor/SimulatedSensorReader.hxx"
#include "wifi/Wifi.hxx"

namespace garageSSDP
{
    static constexpr  char TAG[] = "AppController";

    esp_err_t AppController::start(const AppConfig& config) {
        ESP_LOGI(TAG, "Initializing garage door monitor");
        m_config = config;

        esp_log_level_set("*", m_config.debug_logging ? ESP_LOG_DEBUG : ESP_LOG_INFO);

        m_identity = std::make_unique<DeviceIdentity>(CONFIG_GARAGE2SSDP_DEVICE_UUID, m_config.device_index);
        ESP_LOGI(TAG, "Device %s", m_identity->usn().c_str());

        if (const esp_err_t err = m_loop.init(); err != ESP_OK) {
            return err;
        }
        if (const esp_err_t err = initMonitor(); err != ESP_OK) {
            return err;
        }
        if (const esp_err_t err = esp_register_shutdown_handler(&AppController::ShutdownHandler); err != ESP_OK) {
            ESP_LOGW(TAG, "Failed to register shutdown handler: %s", esp_err_to_name(err));
        }

        initNetworkSubsystem();
        ESP_LOGI(TAG, "Initialization complete");

        if (m_config.simulationMode()) {
            ESP_LOGW(TAG, "Simulation mode active");
        }
        return ESP_OK;
    }

    std::unique_ptr<SensorReader> AppController::makeSensorReader(const int32_t sensor_pin) {
        if (sensor_pin < 0) {
            return std::make_unique<SimulatedSensorReader>();
        }
        auto gpio = std::make_unique<GpioSensorReader>(static_cast<gpio_num_t>(sensor_pin));
        if (gpio->init() != ESP_OK) {
            return nullptr;
        }
        return gpio;
    }

    esp_err_t AppController::initMonitor() {
        m_reader = makeSensorReader(m_config.sensor_pin);
        if (!m_reader) {
            ESP_LOGE(TAG, "No usable door sensor on GPIO %ld", static_cast<long>(m_config.sensor_pin));
            return ESP_ERR_INVALID_ARG;
        }

        const int timeout_ms = static_cast<int>(m_config.notify_timeout_ms);
        NotifyPolicy policy = m_config.notify_expect_no_response
            ? NotifyPolicy::hubDefaults(timeout_ms)
            : NotifyPolicy::strict(timeout_ms);
        m_notifier = std::make_unique<Notifier>(m_registry, *m_identity, std::move(policy));

        m_monitor = std::make_unique<GarageMonitor>(*m_reader, m_state, *m_notifier, m_loop, m_config.poll_interval_s * 1000);
        return m_monitor->start();
    }

    void AppController::initNetworkSubsystem() {
        if (m_config.wifi_ssid.empty()) {
            ESP_LOGE(TAG, "No WiFi credentials configured. Discovery and status service are not started.");
            return;
        }

        auto& wifi = Wifi::Instance();
        if (const esp_err_t err = wifi.init(); err != ESP_OK) {
            ESP_LOGE(TAG, "WiFi init failed: %s", esp_err_to_name(err));
            return;
        }

        wifi.onConnected = [this]() { this->onNetworkConnected(); };
        wifi.onDisconnected = [this]() { this->onNetworkDisconnected(); };

        wifi.connectToAP(m_config.wifi_ssid, m_config.wifi_password);
    }

    void AppController::startNetworkServices() {
        m_endpoint = std::make_unique<StatusEndpoint>(m_state, m_registry, *m_identity, m_loop);
        if (const esp_err_t err = m_endpoint->start(m_config.http_port); err != ESP_OK) {
            ESP_LOGE(TAG, "Status endpoint failed to start: %s", esp_err_to_name(err));
        }

        m_responder = std::make_unique<DiscoveryResponder>(*m_identity, m_loop, m_config.http_port);
        if (const esp_err_t err = m_responder->start(); err != ESP_OK) {
            ESP_LOGE(TAG, "Discovery responder failed to start: %s", esp_err_to_name(err));
        }

        if (m_config.syslog_enabled && !m_config.syslog_server.empty()) {
            SyslogConfig::Instance().init(m_config.syslog_server);
        }
        m_services_started = true;
    }

    void AppController::onNetworkConnected() {
        ESP_LOGI(TAG, "Network Connected. IP: %s", Wifi::Instance().getIpAddress().c_str());

        if (!m_services_started) {
            startNetworkServices();
            return;
        }

        if (!m_responder->isRunning()) {
            m_responder->start();
        } else if (m_responder->rejoinGroup() != ESP_OK) {
            ESP_LOGW(TAG, "Could not rejoin %s after reconnect", SSDP_MULTICAST_ADDR);
        }
    }

    void AppController::onNetworkDisconnected() {
        ESP_LOGW(TAG, "Network Disconnected.");
    }

    void AppController::stop() {
        if (m_responder) {
            m_responder->stop();
        }
        if (m_endpoint) {
            m_endpoint->stop();
        }
    }

    void AppController::ShutdownHandler() {
        Instance().stop();
    }
} // garageSSDP
