// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "notify/SubscriptionRegistry.hxx"

namespace garageSSDP
{
    static constexpr char TAG[] = "Subscriptions";

    SubscribeResult SubscriptionRegistry::subscribe(const std::string& address, const TimestampUs now) {
        const auto [it, inserted] = m_subscriptions.insert_or_assign(address, now + SUBSCRIPTION_TTL_US);
        if (inserted) {
            ESP_LOGI(TAG, "Added subscription %s", address.c_str());
            return SubscribeResult::Added;
        }
        ESP_LOGI(TAG, "Refreshed subscription %s", address.c_str());
        return SubscribeResult::Refreshed;
    }

    std::vector<std::string> SubscriptionRegistry::activeSubscribers(const TimestampUs now) const {
        std::vector<std::string> active;
        for (const auto& [address, expiration] : m_subscriptions) {
            if (expiration > now) {
                active.push_back(address);
            }
        }
        return active;
    }

    std::optional<TimestampUs> SubscriptionRegistry::expirationOf(const std::string& address) const {
        if (const auto it = m_subscriptions.find(address); it != m_subscriptions.end()) {
            return it->second;
        }
        return std::nullopt;
    }
} // garageSSDP
