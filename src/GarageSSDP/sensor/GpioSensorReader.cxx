// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "sensor/GpioSensorReader.hxx"

namespace garageSSDP
{
    static constexpr char TAG[] = "GpioSensor";

    esp_err_t GpioSensorReader::init() {
        if (!GPIO_IS_VALID_GPIO(m_pin)) {
            ESP_LOGE(TAG, "GPIO %d is not a valid input pin", m_pin);
            return ESP_ERR_INVALID_ARG;
        }

        gpio_config_t io_conf = {};
        io_conf.intr_type = GPIO_INTR_DISABLE;
        io_conf.mode = GPIO_MODE_INPUT;
        io_conf.pin_bit_mask = (1ULL << m_pin);
        io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
        io_conf.pull_up_en = GPIO_PULLUP_ENABLE;

        if (const esp_err_t err = gpio_config(&io_conf); err != ESP_OK) {
            ESP_LOGE(TAG, "gpio_config failed for GPIO %d: %s", m_pin, esp_err_to_name(err));
            return err;
        }

        m_initialized = true;
        ESP_LOGI(TAG, "Door sensor on GPIO %d (pull-up, high = open)", m_pin);
        return ESP_OK;
    }

    esp_err_t GpioSensorReader::read(DoorState& out_state) {
        if (!m_initialized) {
            ESP_LOGE(TAG, "Read before GPIO %d was configured", m_pin);
            return ESP_ERR_INVALID_STATE;
        }
        out_state = gpio_get_level(m_pin) ? DoorState::Open : DoorState::Closed;
        return ESP_OK;
    }
} // garageSSDP
