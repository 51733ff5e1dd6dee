// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_DOORSTATE_HXX
#define GARAGESSDP_DOORSTATE_HXX

#include "device/DeviceIdentity.hxx"

namespace garageSSDP
{
    enum class DoorState : uint8_t {
        Unknown,
        Open,
        Closed
    };

    const char* doorStateName(DoorState state);

    // "status-closed" for Closed, "status-open" for everything else.
    const char* statusCommand(DoorState state);

    // <msg><cmd>status-...</cmd><usn>uuid:...::...</usn></msg>
    std::string buildStatusMessage(DoorState state, const DeviceIdentity& identity);

    /**
     * @brief The one current door state. Written by the monitor only.
     */
    class DoorStateCell {
        public:
            DoorStateCell() = default;
            DoorStateCell(const DoorStateCell&) = delete;
            DoorStateCell& operator=(const DoorStateCell&) = delete;

            [[nodiscard]] DoorState get() const { return m_state; }

            /**
             * @brief Store a real reading.
             * @return false when the value is Unknown, which is never re-entered.
             */
            bool set(DoorState state);

        private:
            DoorState m_state{DoorState::Unknown};
    };
} // garageSSDP

#endif //GARAGESSDP_DOORSTATE_HXX
