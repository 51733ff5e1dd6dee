// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "ssdp/DiscoveryResponder.hxx"
#include <lwip/inet.h>
#include <utils/StringUtils.hxx>

namespace garageSSDP
{
    static constexpr char TAG[] = "DiscoveryResponder";
    static constexpr size_t MAX_DATAGRAM_SIZE = 1536;
    static constexpr uint32_t RECEIVER_TASK_STACK = 4096;
    static constexpr int RECEIVER_STOP_POLLS = 10;

    struct ReceiverParams {
        DiscoveryResponder* self;
        utils::SocketHandle socket;
    };

    static constexpr char SEARCH_RESPONSE_FMT[] =
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL:max-age=30\r\n"
        "EXT:\r\n"
        "LOCATION:%s\r\n"
        "SERVER:%s\r\n"
        "ST:%s\r\n"
        "USN:%s";
    static constexpr char SERVER_ID[] = "FreeRTOS, UPnP/1.0, Garage2SSDP/" GARAGESSDP_VERSION;

    DiscoveryResponder::DiscoveryResponder(const DeviceIdentity& identity, const DeviceLoop& loop, const uint16_t status_port, AddressResolver resolver)
        : m_identity(identity), m_loop(loop), m_status_port(status_port), m_resolver(std::move(resolver)) {}

    DiscoveryResponder::~DiscoveryResponder() {
        stop();
    }

    esp_err_t DiscoveryResponder::start() {
        if (m_running) {
            return ESP_OK;
        }

        utils::SocketHandle sock(socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
        if (!sock) {
            ESP_LOGE(TAG, "Failed to create socket: errno %d", errno);
            return ESP_FAIL;
        }

        int reuse = 1;
        if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            ESP_LOGW(TAG, "SO_REUSEADDR failed: errno %d", errno);
        }

        sockaddr_in bind_addr = {};
        bind_addr.sin_family = AF_INET;
        bind_addr.sin_port = htons(SSDP_PORT);
        bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
        if (bind(sock.get(), reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
            ESP_LOGE(TAG, "Failed to bind UDP port %u: errno %d", SSDP_PORT, errno);
            return ESP_FAIL;
        }

        m_fd = sock.get();
        if (const esp_err_t err = changeMembership(IP_ADD_MEMBERSHIP); err != ESP_OK) {
            m_fd = -1;
            return err;
        }

        m_running = true;
        auto* params = new ReceiverParams{this, std::move(sock)};
        TaskHandle_t task = nullptr;
        if (xTaskCreate(ReceiverTask, "ssdp_rx", RECEIVER_TASK_STACK, params, 5, &task) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create receiver task");
            m_running = false;
            changeMembership(IP_DROP_MEMBERSHIP);
            m_fd = -1;
            delete params;
            return ESP_ERR_NO_MEM;
        }
        m_receiver_task = task;

        ESP_LOGI(TAG, "Listening on %s:%u for %s", SSDP_MULTICAST_ADDR, SSDP_PORT, m_identity.deviceTarget().c_str());
        return ESP_OK;
    }

    esp_err_t DiscoveryResponder::rejoinGroup() const {
        if (!m_running) {
            return ESP_ERR_INVALID_STATE;
        }
        changeMembership(IP_DROP_MEMBERSHIP);
        return changeMembership(IP_ADD_MEMBERSHIP);
    }

    void DiscoveryResponder::stop() {
        if (!m_running.exchange(false)) {
            return;
        }
        changeMembership(IP_DROP_MEMBERSHIP);
        // Wakes the receiver; the receiver task owns the close.
        shutdown(m_fd.exchange(-1), SHUT_RDWR);
        for (int i = 0; i < RECEIVER_STOP_POLLS && m_receiver_task.load(); ++i) {
            vTaskDelay(pdMS_TO_TICKS(50));
        }
        ESP_LOGI(TAG, "Left multicast group %s and closed socket", SSDP_MULTICAST_ADDR);
    }

    esp_err_t DiscoveryResponder::changeMembership(const int option) const {
        ip_mreq mreq = {};
        inet_aton(SSDP_MULTICAST_ADDR, &mreq.imr_multiaddr);
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);

        const int fd = m_fd.load();
        if (fd < 0) {
            return ESP_ERR_INVALID_STATE;
        }
        if (setsockopt(fd, IPPROTO_IP, option, &mreq, sizeof(mreq)) < 0) {
            ESP_LOGE(TAG, "%s %s failed: errno %d",
                     option == IP_ADD_MEMBERSHIP ? "Joining" : "Leaving", SSDP_MULTICAST_ADDR, errno);
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    std::optional<SearchReply> DiscoveryResponder::answer(const std::string_view datagram, const Endpoint& requester) const {
        const auto msg = SsdpMessage::parseRequest(datagram);
        if (!msg) {
            ESP_LOGD(TAG, "Discarding malformed datagram from %s:%u", requester.host.c_str(), requester.port);
            return std::nullopt;
        }

        const auto& method = msg->start_line[0];
        const auto& target = msg->start_line[1];
        const auto search_target = msg->header("st").value_or("");
        ESP_LOGD(TAG, "SSDP command %s %s from %s:%u ST '%s'", method.c_str(), target.c_str(),
                 requester.host.c_str(), requester.port, search_target.c_str());

        if (method != SSDP_SEARCH_METHOD || target != "*" ||
            m_identity.deviceTarget().find(search_target) == std::string::npos) {
            ESP_LOGD(TAG, "Ignored SSDP command %s %s", method.c_str(), target.c_str());
            return std::nullopt;
        }

        ESP_LOGI(TAG, "Received %s %s for %s from %s:%u", method.c_str(), target.c_str(),
                 search_target.c_str(), requester.host.c_str(), requester.port);

        const auto local_ip = m_resolver(requester.host);
        if (!local_ip) {
            ESP_LOGW(TAG, "No local address reaches %s, not answering", requester.host.c_str());
            return std::nullopt;
        }

        const std::string location = utils::stringFormat("http://%s:%u/status", local_ip->c_str(), m_status_port);
        return SearchReply{requester, buildSearchResponse(location, search_target, m_identity)};
    }

    void DiscoveryResponder::handleDatagram(const std::string& datagram, const Endpoint& requester) const {
        const auto reply = answer(datagram, requester);
        if (!reply) {
            return;
        }

        sockaddr_in dest = {};
        dest.sin_family = AF_INET;
        dest.sin_port = htons(reply->destination.port);
        if (inet_aton(reply->destination.host.c_str(), &dest.sin_addr) == 0) {
            ESP_LOGW(TAG, "Bad requester address '%s'", reply->destination.host.c_str());
            return;
        }

        const int fd = m_fd.load();
        if (fd < 0) {
            ESP_LOGD(TAG, "Responder stopped, dropping reply to %s", reply->destination.host.c_str());
            return;
        }
        const auto sent = sendto(fd, reply->payload.data(), reply->payload.size(), 0,
                                 reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        if (sent < 0) {
            ESP_LOGE(TAG, "Failed to send search response to %s:%u: errno %d",
                     reply->destination.host.c_str(), reply->destination.port, errno);
        }
    }

    std::string DiscoveryResponder::buildSearchResponse(const std::string& location, const std::string& search_target, const DeviceIdentity& identity) {
        return utils::stringFormat(SEARCH_RESPONSE_FMT, location.c_str(), SERVER_ID, search_target.c_str(), identity.usn().c_str());
    }

    std::optional<std::string> DiscoveryResponder::resolveLocalAddressFor(const std::string& host) {
        // Connecting a UDP socket sends nothing; it only makes the stack pick a route and source address.
        const utils::SocketHandle probe(socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
        if (!probe) {
            ESP_LOGE(TAG, "Failed to create probe socket: errno %d", errno);
            return std::nullopt;
        }

        sockaddr_in remote = {};
        remote.sin_family = AF_INET;
        remote.sin_port = htons(SSDP_PORT);
        if (inet_aton(host.c_str(), &remote.sin_addr) == 0) {
            return std::nullopt;
        }
        if (connect(probe.get(), reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) < 0) {
            ESP_LOGW(TAG, "No route to %s: errno %d", host.c_str(), errno);
            return std::nullopt;
        }

        sockaddr_in local = {};
        socklen_t local_len = sizeof(local);
        if (getsockname(probe.get(), reinterpret_cast<sockaddr*>(&local), &local_len) < 0) {
            ESP_LOGW(TAG, "getsockname failed: errno %d", errno);
            return std::nullopt;
        }

        std::array<char, INET_ADDRSTRLEN> buf{};
        if (!inet_ntop(AF_INET, &local.sin_addr, buf.data(), buf.size())) {
            return std::nullopt;
        }
        return std::string(buf.data());
    }

    void DiscoveryResponder::ReceiverTask(void* arg) {
        auto* params = static_cast<ReceiverParams*>(arg);
        DiscoveryResponder* self = params->self;
        const int fd = params->socket.get();
        std::vector<char> buf(MAX_DATAGRAM_SIZE);

        while (self->m_running) {
            sockaddr_in source = {};
            socklen_t source_len = sizeof(source);
            const auto len = recvfrom(fd, buf.data(), buf.size(), 0,
                                      reinterpret_cast<sockaddr*>(&source), &source_len);
            if (len < 0) {
                if (self->m_running) {
                    ESP_LOGW(TAG, "recvfrom failed: errno %d", errno);
                    vTaskDelay(pdMS_TO_TICKS(100));
                }
                continue;
            }

            std::array<char, INET_ADDRSTRLEN> host{};
            inet_ntop(AF_INET, &source.sin_addr, host.data(), host.size());
            Endpoint requester{host.data(), ntohs(source.sin_port)};
            std::string datagram(buf.data(), static_cast<size_t>(len));

            self->m_loop.post([self, datagram = std::move(datagram), requester = std::move(requester)]() {
                self->handleDatagram(datagram, requester);
            });
        }

        ESP_LOGD(TAG, "Receiver task exiting");
        // Closed by loop work, so no queued reply can write to a reused descriptor.
        auto owned = std::make_shared<utils::SocketHandle>(std::move(params->socket));
        self->m_loop.post([owned]() { owned->reset(); });
        delete params;
        self->m_receiver_task = nullptr;
        vTaskDelete(nullptr);
    }
} // garageSSDP
