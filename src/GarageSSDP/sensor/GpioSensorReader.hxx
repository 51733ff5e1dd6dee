// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_GPIOSENSORREADER_HXX
#define GARAGESSDP_GPIOSENSORREADER_HXX

#include <driver/gpio.h>
#include "sensor/SensorReader.hxx"

namespace garageSSDP
{
    // Reed switch to ground, internal pull-up: high = open, low = closed.
    class GpioSensorReader final : public SensorReader {
        public:
            explicit GpioSensorReader(gpio_num_t pin) : m_pin(pin) {}

            esp_err_t init();
            esp_err_t read(DoorState& out_state) override;
            [[nodiscard]] const char* name() const override { return "gpio"; }

        private:
            const gpio_num_t m_pin;
            bool m_initialized{false};
    };
} // garageSSDP

#endif //GARAGESSDP_GPIOSENSORREADER_HXX
