// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_DEVICEIDENTITY_HXX
#define GARAGESSDP_DEVICEIDENTITY_HXX

#include <utils/StringUtils.hxx>

namespace garageSSDP
{
    static constexpr char DEVICE_TARGET_PREFIX[] = "urn:schemas-upnp-org:device:RPi_Garage_Monitor:";

    class DeviceIdentity {
        public:
            DeviceIdentity(std::string uuid, const uint32_t device_index)
                : m_uuid(std::move(uuid)),
                  m_device_target(utils::stringFormat("%s%lu", DEVICE_TARGET_PREFIX, static_cast<unsigned long>(device_index))) {}

            [[nodiscard]] const std::string& uuid() const { return m_uuid; }
            [[nodiscard]] const std::string& deviceTarget() const { return m_device_target; }

            // uuid:<uuid>::<device target>
            [[nodiscard]] std::string usn() const {
                return utils::stringFormat("uuid:%s::%s", m_uuid.c_str(), m_device_target.c_str());
            }

        private:
            const std::string m_uuid;
            const std::string m_device_target;
    };
} // garageSSDP

#endif //GARAGESSDP_DEVICEIDENTITY_HXX
