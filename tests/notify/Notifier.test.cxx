// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include <esp_http_client.h>
#include "notify/Notifier.hxx"

using namespace garageSSDP;

namespace {
    struct Sent {
        std::string url;
        std::string body;
    };

    const DeviceIdentity identity("d1c58eb4-9220-11e4-96fa-123b93f75cba", 1);
}

static void test_notify_all_active_subscribers() {
    SubscriptionRegistry registry;
    registry.subscribe("http://hub-a/notify", 0);
    registry.subscribe("http://hub-b/notify", 0);

    std::vector<Sent> sent;
    const Notifier notifier(registry, identity, NotifyPolicy::hubDefaults(5000),
                            [&sent](const std::string& url, const std::string& body) { sent.push_back({url, body}); });

    TEST_ASSERT_EQUAL(2, notifier.notifyAll(DoorState::Closed, 1000));
    TEST_ASSERT_EQUAL(2, sent.size());
    TEST_ASSERT_EQUAL_STRING("http://hub-a/notify", sent[0].url.c_str());
    TEST_ASSERT_EQUAL_STRING("http://hub-b/notify", sent[1].url.c_str());
    TEST_ASSERT_EQUAL_STRING("<msg><cmd>status-closed</cmd><usn>uuid:d1c58eb4-9220-11e4-96fa-123b93f75cba::"
                             "urn:schemas-upnp-org:device:RPi_Garage_Monitor:1</usn></msg>", sent[0].body.c_str());
}

static void test_expired_subscribers_are_not_notified() {
    SubscriptionRegistry registry;
    registry.subscribe("http://stale/notify", 0);

    size_t calls = 0;
    const Notifier notifier(registry, identity, NotifyPolicy::hubDefaults(5000),
                            [&calls](const std::string&, const std::string&) { ++calls; });

    TEST_ASSERT_EQUAL(0, notifier.notifyAll(DoorState::Open, SUBSCRIPTION_TTL_US + 1));
    TEST_ASSERT_EQUAL(0, calls);
}

static void test_open_and_unknown_report_status_open() {
    SubscriptionRegistry registry;
    registry.subscribe("http://hub/notify", 0);

    std::vector<std::string> bodies;
    const Notifier notifier(registry, identity, NotifyPolicy::hubDefaults(5000),
                            [&bodies](const std::string&, const std::string& body) { bodies.push_back(body); });

    notifier.notifyAll(DoorState::Open, 0);
    notifier.notifyAll(DoorState::Unknown, 0);
    TEST_ASSERT_TRUE(bodies[0].find("<cmd>status-open</cmd>") != std::string::npos);
    TEST_ASSERT_TRUE(bodies[1].find("<cmd>status-open</cmd>") != std::string::npos);
}

static void test_classify_hub_defaults() {
    const auto policy = NotifyPolicy::hubDefaults(5000);
    TEST_ASSERT_EQUAL(NotifyOutcome::ExpectedNoResponse, classifyNotifyResult(ESP_ERR_HTTP_FETCH_HEADER, policy));
    TEST_ASSERT_EQUAL(NotifyOutcome::ExpectedNoResponse, classifyNotifyResult(ESP_ERR_HTTP_CONNECTION_CLOSED, policy));
    TEST_ASSERT_EQUAL(NotifyOutcome::UnexpectedResponse, classifyNotifyResult(ESP_OK, policy));
    TEST_ASSERT_EQUAL(NotifyOutcome::Failed, classifyNotifyResult(ESP_ERR_HTTP_CONNECT, policy));
    TEST_ASSERT_EQUAL(NotifyOutcome::Failed, classifyNotifyResult(ESP_ERR_HTTP_EAGAIN, policy));
}

static void test_classify_strict_policy() {
    const auto policy = NotifyPolicy::strict(1000);
    TEST_ASSERT_EQUAL(1000, policy.timeout_ms);
    TEST_ASSERT_EQUAL(NotifyOutcome::Failed, classifyNotifyResult(ESP_ERR_HTTP_FETCH_HEADER, policy));
    TEST_ASSERT_EQUAL(NotifyOutcome::UnexpectedResponse, classifyNotifyResult(ESP_OK, policy));
}

void run_notifier_tests() {
    RUN_TEST(test_notify_all_active_subscribers);
    RUN_TEST(test_expired_subscribers_are_not_notified);
    RUN_TEST(test_open_and_unknown_report_status_open);
    RUN_TEST(test_classify_hub_defaults);
    RUN_TEST(test_classify_strict_policy);
}
