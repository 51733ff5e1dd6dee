// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_GARAGEMONITOR_HXX
#define GARAGESSDP_GARAGEMONITOR_HXX

#include "sensor/SensorReader.hxx"
#include "notify/Notifier.hxx"
#include "loop/DeviceLoop.hxx"

namespace garageSSDP
{
    /**
     * @brief Polls the sensor every interval and pushes state changes to subscribers.
     *
     * The timer is one-shot and re-armed after each tick has finished, so ticks
     * never overlap and processing time adds to the period.
     */
    class GarageMonitor {
        public:
            GarageMonitor(SensorReader& reader, DoorStateCell& state, const Notifier& notifier, const DeviceLoop& loop, uint32_t interval_ms);
            ~GarageMonitor();
            GarageMonitor(const GarageMonitor&) = delete;
            GarageMonitor& operator=(const GarageMonitor&) = delete;

            // Arms the first tick one interval from now.
            esp_err_t start();

            /**
             * @brief Read once, store and notify on change. Runs on the device loop.
             * @return true when the state changed.
             */
            bool checkState();

        private:
            static void TimerCallback(void* arg);
            void tick();
            void scheduleNext() const;

            SensorReader& m_reader;
            DoorStateCell& m_state;
            const Notifier& m_notifier;
            const DeviceLoop& m_loop;
            const uint32_t m_interval_ms;
            esp_timer_handle_t m_timer{nullptr};
    };
} // garageSSDP

#endif //GARAGESSDP_GARAGEMONITOR_HXX
