// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_NOTIFIER_HXX
#define GARAGESSDP_NOTIFIER_HXX

#include "notify/SubscriptionRegistry.hxx"
#include "device/DoorState.hxx"

namespace garageSSDP
{
    enum class NotifyOutcome {
        ExpectedNoResponse,
        UnexpectedResponse,
        Failed
    };

    /**
     * @brief Which transport errors count as the hub's usual "closed without a response".
     */
    struct NotifyPolicy {
        int timeout_ms{5000};
        std::vector<esp_err_t> expected_failures;

        [[nodiscard]] bool isExpectedFailure(esp_err_t err) const;

        // Default hub behavior: the connection is dropped before any status line arrives.
        static NotifyPolicy hubDefaults(int timeout_ms);
        // Every failure is reported as an anomaly.
        static NotifyPolicy strict(int timeout_ms);
    };

    /**
     * @param err Result of the POST.
     * @param policy Expected failure kinds.
     */
    NotifyOutcome classifyNotifyResult(esp_err_t err, const NotifyPolicy& policy);

    class Notifier {
        public:
            using Dispatcher = std::function<void(const std::string& url, const std::string& body)>;

            /**
             * @param dispatcher Sends one message; defaults to a fire-and-forget HTTP POST task.
             */
            Notifier(const SubscriptionRegistry& registry, const DeviceIdentity& identity, NotifyPolicy policy, Dispatcher dispatcher = {});
            Notifier(const Notifier&) = delete;
            Notifier& operator=(const Notifier&) = delete;

            /**
             * @brief Send the state to every subscriber active at now.
             * @return number of sends started.
             */
            size_t notifyAll(DoorState state, TimestampUs now) const;

        private:
            void launchPost(const std::string& url, const std::string& body) const;
            static void PostTask(void* arg);

            const SubscriptionRegistry& m_registry;
            const DeviceIdentity& m_identity;
            const NotifyPolicy m_policy;
            Dispatcher m_dispatcher;
    };
} // garageSSDP

#endif //GARAGESSDP_NOTIFIER_HXX
