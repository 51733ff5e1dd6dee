// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_SENSORREADER_HXX
#define GARAGESSDP_SENSORREADER_HXX

#include "device/DoorState.hxx"

namespace garageSSDP
{
    class SensorReader {
        public:
            virtual ~SensorReader() = default;

            /**
             * @brief Take one reading of the door contact.
             * @param out_state Receives the reading on ESP_OK.
             */
            virtual esp_err_t read(DoorState& out_state) = 0;

            [[nodiscard]] virtual const char* name() const = 0;
    };
} // garageSSDP

#endif //GARAGESSDP_SENSORREADER_HXX
