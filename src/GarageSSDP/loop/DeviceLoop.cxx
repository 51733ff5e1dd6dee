// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "loop/DeviceLoop.hxx"

namespace garageSSDP {
    static constexpr char TAG[] = "DeviceLoop";
    static constexpr uint32_t LOOP_TASK_STACK = 6144;
    static constexpr UBaseType_t LOOP_TASK_PRIORITY = 5;

    DeviceLoop::~DeviceLoop() {
        if (m_task) {
            vTaskDelete(m_task);
        }
        if (m_queue) {
            Work* pending = nullptr;
            while (xQueueReceive(m_queue, &pending, 0) == pdPASS) {
                delete pending;
            }
            vQueueDelete(m_queue);
        }
    }

    esp_err_t DeviceLoop::init(const size_t queue_length) {
        if (m_queue) return ESP_OK;

        m_queue = xQueueCreate(queue_length, sizeof(Work*));
        if (!m_queue) {
            ESP_LOGE(TAG, "Failed to create work queue");
            return ESP_ERR_NO_MEM;
        }

        if (xTaskCreate(LoopTask, "device_loop", LOOP_TASK_STACK, this, LOOP_TASK_PRIORITY, &m_task) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create loop task");
            vQueueDelete(m_queue);
            m_queue = nullptr;
            return ESP_ERR_NO_MEM;
        }
        ESP_LOGI(TAG, "Device loop started (queue depth %u)", static_cast<unsigned>(queue_length));
        return ESP_OK;
    }

    bool DeviceLoop::post(Work work) const {
        if (!m_queue || !work) return false;

        auto* item = new Work(std::move(work));
        if (xQueueSend(m_queue, &item, 0) != pdPASS) {
            ESP_LOGE(TAG, "Queue full, dropping work item");
            delete item;
            return false;
        }
        return true;
    }

    bool DeviceLoop::isLoopTask() const {
        return m_task != nullptr && xTaskGetCurrentTaskHandle() == m_task;
    }

    [[noreturn]] void DeviceLoop::LoopTask(void* arg) {
        const auto* self = static_cast<DeviceLoop*>(arg);
        Work* item = nullptr;

        while (true) {
            if (xQueueReceive(self->m_queue, &item, portMAX_DELAY) == pdPASS && item) {
                (*item)();
                delete item;
            }
        }
    }
} // garageSSDP
