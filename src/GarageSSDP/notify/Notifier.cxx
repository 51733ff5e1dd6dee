// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "notify/Notifier.hxx"
#include <esp_http_client.h>

namespace garageSSDP
{
    static constexpr char TAG[] = "Notifier";
    static constexpr uint32_t POST_TASK_STACK = 4096;

    struct PostParams {
        std::string url;
        std::string body;
        NotifyPolicy policy;
    };

    bool NotifyPolicy::isExpectedFailure(const esp_err_t err) const {
        return std::ranges::find(expected_failures, err) != expected_failures.end();
    }

    NotifyPolicy NotifyPolicy::hubDefaults(const int timeout_ms) {
        return NotifyPolicy{timeout_ms, {ESP_ERR_HTTP_FETCH_HEADER, ESP_ERR_HTTP_CONNECTION_CLOSED}};
    }

    NotifyPolicy NotifyPolicy::strict(const int timeout_ms) {
        return NotifyPolicy{timeout_ms, {}};
    }

    NotifyOutcome classifyNotifyResult(const esp_err_t err, const NotifyPolicy& policy) {
        if (err == ESP_OK) {
            return NotifyOutcome::UnexpectedResponse;
        }
        return policy.isExpectedFailure(err) ? NotifyOutcome::ExpectedNoResponse : NotifyOutcome::Failed;
    }

    Notifier::Notifier(const SubscriptionRegistry& registry, const DeviceIdentity& identity, NotifyPolicy policy, Dispatcher dispatcher)
        : m_registry(registry), m_identity(identity), m_policy(std::move(policy)), m_dispatcher(std::move(dispatcher)) {
        if (!m_dispatcher) {
            m_dispatcher = [this](const std::string& url, const std::string& body) { launchPost(url, body); };
        }
    }

    size_t Notifier::notifyAll(const DoorState state, const TimestampUs now) const {
        const std::string body = buildStatusMessage(state, m_identity);
        const auto subscribers = m_registry.activeSubscribers(now);

        for (const auto& url : subscribers) {
            ESP_LOGI(TAG, "Notifying hub %s", url.c_str());
            m_dispatcher(url, body);
        }
        return subscribers.size();
    }

    void Notifier::launchPost(const std::string& url, const std::string& body) const {
        auto* params = new PostParams{url, body, m_policy};
        if (xTaskCreate(PostTask, "notify_post", POST_TASK_STACK, params, 4, nullptr) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create notify task for %s", url.c_str());
            delete params;
        }
    }

    static void performPost(const PostParams& params) {
        esp_http_client_config_t config = {};
        config.url = params.url.c_str();
        config.method = HTTP_METHOD_POST;
        config.timeout_ms = params.policy.timeout_ms;
        config.disable_auto_redirect = true;

        esp_http_client_handle_t client = esp_http_client_init(&config);
        if (!client) {
            ESP_LOGE(TAG, "Failed to init HTTP client for %s", params.url.c_str());
            return;
        }

        esp_http_client_set_post_field(client, params.body.c_str(), static_cast<int>(params.body.size()));
        const esp_err_t err = esp_http_client_perform(client);

        switch (classifyNotifyResult(err, params.policy)) {
            case NotifyOutcome::ExpectedNoResponse:
                ESP_LOGD(TAG, "Response failed (expected) for %s: %s", params.url.c_str(), esp_err_to_name(err));
                break;
            case NotifyOutcome::UnexpectedResponse:
                ESP_LOGE(TAG, "Unexpected response code from %s: %d", params.url.c_str(), esp_http_client_get_status_code(client));
                break;
            case NotifyOutcome::Failed:
                ESP_LOGE(TAG, "Unexpected failure notifying %s: %s", params.url.c_str(), esp_err_to_name(err));
                break;
        }
        esp_http_client_cleanup(client);
    }

    void Notifier::PostTask(void* arg) {
        const auto* params = static_cast<PostParams*>(arg);
        performPost(*params);
        delete params;
        vTaskDelete(nullptr);
    }
} // garageSSDP
