// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_STATUSENDPOINT_HXX
#define GARAGESSDP_STATUSENDPOINT_HXX

#include <esp_http_server.h>
#include "device/DoorState.hxx"
#include "notify/SubscriptionRegistry.hxx"
#include "loop/DeviceLoop.hxx"

namespace garageSSDP
{
    static constexpr char STATUS_PATH[] = "/status";

    /**
     * @brief HTTP side of the device: GET /status for polling, SUBSCRIBE for push registration.
     *
     * Requests are answered asynchronously from the device loop.
     */
    class StatusEndpoint {
    public:
        StatusEndpoint(const DoorStateCell& state, SubscriptionRegistry& registry, const DeviceIdentity& identity, const DeviceLoop& loop);
        ~StatusEndpoint();
        StatusEndpoint(const StatusEndpoint&) = delete;
        StatusEndpoint& operator=(const StatusEndpoint&) = delete;

        esp_err_t start(uint16_t port);
        esp_err_t stop();

        // Body for a GET; empty for anything but /status.
        [[nodiscard]] std::string handlePoll(std::string_view path, const std::string& client) const;

        // Registers the callback when present; always returns the status body.
        std::string handleSubscribe(const std::optional<std::string>& callback_header, TimestampUs now);

        // "<http://hub/notify>" -> "http://hub/notify"
        static std::optional<std::string> parseCallbackHeader(std::string_view value);

    private:
        static esp_err_t GetHandler(httpd_req_t *req);
        static esp_err_t SubscribeHandler(httpd_req_t *req);

        esp_err_t answerOnLoop(httpd_req_t *req, std::function<std::string()> respond) const;

        static std::string clientAddress(httpd_req_t *req);
        static std::optional<std::string> headerValue(httpd_req_t *req, const char* name);

        const DoorStateCell& m_state;
        SubscriptionRegistry& m_registry;
        const DeviceIdentity& m_identity;
        const DeviceLoop& m_loop;
        httpd_handle_t server_handle{nullptr};
    };
} // garageSSDP

#endif //GARAGESSDP_STATUSENDPOINT_HXX
