// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_DISCOVERYRESPONDER_HXX
#define GARAGESSDP_DISCOVERYRESPONDER_HXX

#include <utils/SocketHandle.hxx>
#include "ssdp/SsdpMessage.hxx"
#include "device/DeviceIdentity.hxx"
#include "loop/DeviceLoop.hxx"

namespace garageSSDP
{
    struct SearchReply {
        Endpoint destination;
        std::string payload;
    };

    /**
     * @brief Answers M-SEARCH requests for this device's target with a unicast reply.
     *
     * Datagrams are received on a dedicated task and handled on the device loop.
     */
    class DiscoveryResponder {
        public:
            // Local address the requester can reach us on, or nullopt.
            using AddressResolver = std::function<std::optional<std::string>(const std::string& host)>;

            DiscoveryResponder(const DeviceIdentity& identity, const DeviceLoop& loop, uint16_t status_port,
                               AddressResolver resolver = resolveLocalAddressFor);
            ~DiscoveryResponder();
            DiscoveryResponder(const DiscoveryResponder&) = delete;
            DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

            esp_err_t start();
            esp_err_t rejoinGroup() const;
            void stop();

            [[nodiscard]] bool isRunning() const { return m_running; }

            /**
             * @brief Decide whether a datagram gets a reply and build it.
             * @return nullopt for malformed or non-matching requests.
             */
            [[nodiscard]] std::optional<SearchReply> answer(std::string_view datagram, const Endpoint& requester) const;

            void handleDatagram(const std::string& datagram, const Endpoint& requester) const;

            static std::string buildSearchResponse(const std::string& location, const std::string& search_target, const DeviceIdentity& identity);
            static std::optional<std::string> resolveLocalAddressFor(const std::string& host);

        private:
            static void ReceiverTask(void* arg);
            esp_err_t changeMembership(int option) const;

            const DeviceIdentity& m_identity;
            const DeviceLoop& m_loop;
            const uint16_t m_status_port;
            const AddressResolver m_resolver;

            std::atomic<int> m_fd{-1};
            std::atomic<TaskHandle_t> m_receiver_task{nullptr};
            std::atomic<bool> m_running{false};
    };
} // garageSSDP

#endif //GARAGESSDP_DISCOVERYRESPONDER_HXX
