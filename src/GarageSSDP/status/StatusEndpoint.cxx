// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "status/StatusEndpoint.hxx"
#include <lwip/sockets.h>
#include <utils/StringUtils.hxx>

namespace garageSSDP
{
    static constexpr char TAG[] = "StatusEndpoint";

    StatusEndpoint::StatusEndpoint(const DoorStateCell& state, SubscriptionRegistry& registry, const DeviceIdentity& identity, const DeviceLoop& loop)
        : m_state(state), m_registry(registry), m_identity(identity), m_loop(loop) {}

    StatusEndpoint::~StatusEndpoint() {
        stop();
    }

    esp_err_t StatusEndpoint::start(const uint16_t port) {
        if (server_handle) {
            return ESP_OK;
        }

        httpd_config_t config = HTTPD_DEFAULT_CONFIG();
        config.server_port = port;
        config.lru_purge_enable = true;
        config.uri_match_fn = httpd_uri_match_wildcard;
        config.max_uri_handlers = 2;
        config.max_open_sockets = 4;
        config.backlog_conn = 4;
        ESP_LOGI(TAG, "Starting server on port: '%d'", config.server_port);
        if (const esp_err_t err = httpd_start(&server_handle, &config); err != ESP_OK) {
            ESP_LOGE(TAG, "Error starting server: %s", esp_err_to_name(err));
            server_handle = nullptr;
            return err;
        }

        const std::array<httpd_uri_t, 2> handlers = {{
            { .uri = "/*", .method = HTTP_GET,       .handler = GetHandler,       .user_ctx = this },
            { .uri = "/*", .method = HTTP_SUBSCRIBE, .handler = SubscribeHandler, .user_ctx = this },
        }};

        for (auto const& handler : handlers) {
            if (const esp_err_t err = httpd_register_uri_handler(server_handle, &handler); err != ESP_OK) {
                ESP_LOGE(TAG, "Failed to register handler for %s: %s", handler.uri, esp_err_to_name(err));
                stop();
                return err;
            }
        }
        return ESP_OK;
    }

    esp_err_t StatusEndpoint::stop() {
        if (!server_handle) {
            return ESP_OK;
        }
        const esp_err_t err = httpd_stop(server_handle);
        server_handle = nullptr;
        ESP_LOGI(TAG, "HTTP server stopped");
        return err;
    }

    std::string StatusEndpoint::handlePoll(const std::string_view path, const std::string& client) const {
        if (path != STATUS_PATH) {
            ESP_LOGI(TAG, "Received bogus request from %s for %.*s", client.c_str(), static_cast<int>(path.size()), path.data());
            return {};
        }

        const DoorState state = m_state.get();
        ESP_LOGI(TAG, "Polling request from %s for %s - returned %s", client.c_str(), STATUS_PATH, statusCommand(state));
        return buildStatusMessage(state, m_identity);
    }

    std::string StatusEndpoint::handleSubscribe(const std::optional<std::string>& callback_header, const TimestampUs now) {
        ESP_LOGD(TAG, "SUBSCRIBE: callback %s", callback_header ? callback_header->c_str() : "(none)");
        if (callback_header) {
            if (const auto address = parseCallbackHeader(*callback_header)) {
                m_registry.subscribe(*address, now);
            } else {
                ESP_LOGW(TAG, "Ignoring empty Callback header");
            }
        }
        return buildStatusMessage(m_state.get(), m_identity);
    }

    std::optional<std::string> StatusEndpoint::parseCallbackHeader(const std::string_view value) {
        std::string_view address = utils::trim(value);
        if (address.starts_with('<')) {
            address.remove_prefix(1);
            if (const auto close = address.find('>'); close != std::string_view::npos) {
                address = address.substr(0, close);
            }
        }
        address = utils::trim(address);
        if (address.empty()) {
            return std::nullopt;
        }
        return std::string(address);
    }

    esp_err_t StatusEndpoint::answerOnLoop(httpd_req_t *req, std::function<std::string()> respond) const {
        httpd_req_t* async_req = nullptr;
        if (const esp_err_t err = httpd_req_async_handler_begin(req, &async_req); err != ESP_OK) {
            ESP_LOGE(TAG, "Cannot defer request: %s", esp_err_to_name(err));
            httpd_resp_send_500(req);
            return err;
        }

        const bool posted = m_loop.post([async_req, respond = std::move(respond)]() {
            const std::string body = respond();
            if (httpd_resp_send(async_req, body.data(), static_cast<ssize_t>(body.size())) != ESP_OK) {
                ESP_LOGW(TAG, "Failed to send response");
            }
            httpd_req_async_handler_complete(async_req);
        });

        if (!posted) {
            ESP_LOGE(TAG, "Device loop unavailable, answering 500");
            httpd_resp_send_500(async_req);
            httpd_req_async_handler_complete(async_req);
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    esp_err_t StatusEndpoint::GetHandler(httpd_req_t *req) {
        auto* self = static_cast<StatusEndpoint*>(req->user_ctx);

        std::string_view uri(req->uri);
        if (const auto query = uri.find('?'); query != std::string_view::npos) {
            uri = uri.substr(0, query);
        }

        return self->answerOnLoop(req, [self, path = std::string(uri), client = clientAddress(req)]() {
            return self->handlePoll(path, client);
        });
    }

    esp_err_t StatusEndpoint::SubscribeHandler(httpd_req_t *req) {
        auto* self = static_cast<StatusEndpoint*>(req->user_ctx);

        return self->answerOnLoop(req, [self, callback = headerValue(req, "Callback")]() {
            return self->handleSubscribe(callback, esp_timer_get_time());
        });
    }

    std::optional<std::string> StatusEndpoint::headerValue(httpd_req_t *req, const char* name) {
        const size_t buf_len = httpd_req_get_hdr_value_len(req, name) + 1;
        if (buf_len <= 1) {
            return std::nullopt;
        }

        std::vector<char> buf(buf_len);
        if (httpd_req_get_hdr_value_str(req, name, buf.data(), buf_len) != ESP_OK) {
            return std::nullopt;
        }
        return std::string(buf.data());
    }

    std::string StatusEndpoint::clientAddress(httpd_req_t *req) {
        sockaddr_storage addr = {};
        socklen_t addr_len = sizeof(addr);
        if (getpeername(httpd_req_to_sockfd(req), reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
            return "unknown";
        }

        std::array<char, INET6_ADDRSTRLEN> buf{};
        const void* src = addr.ss_family == AF_INET6
            ? static_cast<const void*>(&reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_addr)
            : static_cast<const void*>(&reinterpret_cast<const sockaddr_in*>(&addr)->sin_addr);
        if (!inet_ntop(addr.ss_family, src, buf.data(), buf.size())) {
            return "unknown";
        }
        return std::string(buf.data());
    }
} // garageSSDP
