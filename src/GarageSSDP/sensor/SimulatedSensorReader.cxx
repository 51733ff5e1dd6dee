// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "sensor/SimulatedSensorReader.hxx"

namespace garageSSDP
{
    esp_err_t SimulatedSensorReader::read(DoorState& out_state) {
        if (--m_countdown <= 0) {
            m_countdown = FLIP_PERIOD;
            m_state = (m_state == DoorState::Closed) ? DoorState::Open : DoorState::Closed;
        }
        out_state = m_state;
        return ESP_OK;
    }
} // garageSSDP
