// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "monitor/GarageMonitor.hxx"

namespace garageSSDP
{
    static constexpr char TAG[] = "GarageMonitor";

    GarageMonitor::GarageMonitor(SensorReader& reader, DoorStateCell& state, const Notifier& notifier, const DeviceLoop& loop, const uint32_t interval_ms)
        : m_reader(reader), m_state(state), m_notifier(notifier), m_loop(loop), m_interval_ms(interval_ms) {}

    GarageMonitor::~GarageMonitor() {
        if (m_timer) {
            esp_timer_stop(m_timer);
            esp_timer_delete(m_timer);
        }
    }

    esp_err_t GarageMonitor::start() {
        if (m_timer) {
            ESP_LOGW(TAG, "Monitor already started.");
            return ESP_OK;
        }

        const esp_timer_create_args_t args = {
            .callback = &GarageMonitor::TimerCallback,
            .arg = this,
            .dispatch_method = ESP_TIMER_TASK,
            .name = "garage_poll",
            .skip_unhandled_events = true,
        };
        if (const esp_err_t err = esp_timer_create(&args, &m_timer); err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to create poll timer: %s", esp_err_to_name(err));
            return err;
        }

        ESP_LOGI(TAG, "Polling %s sensor every %lu ms", m_reader.name(), static_cast<unsigned long>(m_interval_ms));
        scheduleNext();
        return ESP_OK;
    }

    bool GarageMonitor::checkState() {
        DoorState current = DoorState::Unknown;
        const esp_err_t err = m_reader.read(current);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Sensor read failed: %s. Door state is unavailable, restarting.", esp_err_to_name(err));
        }
        ESP_ERROR_CHECK(err);

        const DoorState previous = m_state.get();
        if (current == previous || !m_state.set(current)) {
            return false;
        }

        ESP_LOGI(TAG, "State changed from %s to %s", doorStateName(previous), doorStateName(current));
        m_notifier.notifyAll(current, esp_timer_get_time());
        return true;
    }

    void GarageMonitor::tick() {
        checkState();
        scheduleNext();
    }

    void GarageMonitor::scheduleNext() const {
        if (const esp_err_t err = esp_timer_start_once(m_timer, static_cast<uint64_t>(m_interval_ms) * 1000); err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to arm poll timer: %s", esp_err_to_name(err));
        }
    }

    void GarageMonitor::TimerCallback(void* arg) {
        auto* self = static_cast<GarageMonitor*>(arg);
        if (!self->m_loop.post([self]() { self->tick(); })) {
            ESP_LOGW(TAG, "Loop busy, polling again next interval");
            self->scheduleNext();
        }
    }
} // garageSSDP
