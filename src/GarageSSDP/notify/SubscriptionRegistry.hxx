// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_SUBSCRIPTIONREGISTRY_HXX
#define GARAGESSDP_SUBSCRIPTIONREGISTRY_HXX

namespace garageSSDP
{
    // Microseconds on the esp_timer clock.
    using TimestampUs = int64_t;

    static constexpr TimestampUs SUBSCRIPTION_TTL_US = 24LL * 3600 * 1000 * 1000;

    enum class SubscribeResult {
        Added,
        Refreshed
    };

    /**
     * @brief Callback address -> expiration instant.
     *
     * Expired entries stay in the map; they are only filtered out of activeSubscribers().
     */
    class SubscriptionRegistry {
        public:
            SubscriptionRegistry() = default;
            SubscriptionRegistry(const SubscriptionRegistry&) = delete;
            SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

            SubscribeResult subscribe(const std::string& address, TimestampUs now);

            // Addresses whose expiration is strictly after now.
            [[nodiscard]] std::vector<std::string> activeSubscribers(TimestampUs now) const;

            [[nodiscard]] std::optional<TimestampUs> expirationOf(const std::string& address) const;
            [[nodiscard]] size_t size() const { return m_subscriptions.size(); }

        private:
            std::map<std::string, TimestampUs> m_subscriptions;
    };
} // garageSSDP

#endif //GARAGESSDP_SUBSCRIPTIONREGISTRY_HXX
