// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_SIMULATEDSENSORREADER_HXX
#define GARAGESSDP_SIMULATEDSENSORREADER_HXX

#include "sensor/SensorReader.hxx"

namespace garageSSDP
{
    /**
     * @brief Stand-in for boards without a door contact.
     *
     * Counts reads down from 3; on the third read the reported state flips
     * (Unknown or Open becomes Closed, Closed becomes Open) and the count restarts.
     */
    class SimulatedSensorReader final : public SensorReader {
        public:
            static constexpr int FLIP_PERIOD = 3;

            explicit SimulatedSensorReader(DoorState initial = DoorState::Unknown) : m_state(initial) {}

            esp_err_t read(DoorState& out_state) override;
            [[nodiscard]] const char* name() const override { return "simulated"; }

        private:
            DoorState m_state;
            int m_countdown{FLIP_PERIOD};
    };
} // garageSSDP

#endif //GARAGESSDP_SIMULATEDSENSORREADER_HXX
