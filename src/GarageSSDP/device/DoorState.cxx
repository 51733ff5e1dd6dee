// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "device/DoorState.hxx"

namespace garageSSDP
{
    const char* doorStateName(const DoorState state) {
        switch (state) {
            case DoorState::Open:   return "open";
            case DoorState::Closed: return "closed";
            default:                return "unknown";
        }
    }

    const char* statusCommand(const DoorState state) {
        return state == DoorState::Closed ? "status-closed" : "status-open";
    }

    std::string buildStatusMessage(const DoorState state, const DeviceIdentity& identity) {
        return utils::stringFormat("<msg><cmd>%s</cmd><usn>%s</usn></msg>", statusCommand(state), identity.usn().c_str());
    }

    bool DoorStateCell::set(const DoorState state) {
        if (state == DoorState::Unknown) {
            return false;
        }
        m_state = state;
        return true;
    }
} // garageSSDP
