// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "status/StatusEndpoint.hxx"

using namespace garageSSDP;

namespace {
    struct Fixture {
        DeviceIdentity identity{"d1c58eb4-9220-11e4-96fa-123b93f75cba", 1};
        DoorStateCell state;
        SubscriptionRegistry registry;
        DeviceLoop loop;
        StatusEndpoint endpoint{state, registry, identity, loop};
    };

    constexpr char OPEN_BODY[] = "<msg><cmd>status-open</cmd><usn>uuid:d1c58eb4-9220-11e4-96fa-123b93f75cba::"
                                 "urn:schemas-upnp-org:device:RPi_Garage_Monitor:1</usn></msg>";
}

static void test_poll_status_before_first_reading() {
    Fixture f;
    TEST_ASSERT_EQUAL_STRING(OPEN_BODY, f.endpoint.handlePoll("/status", "192.168.1.10").c_str());
}

static void test_poll_status_closed() {
    Fixture f;
    f.state.set(DoorState::Closed);
    const auto body = f.endpoint.handlePoll("/status", "192.168.1.10");
    TEST_ASSERT_TRUE(body.find("<cmd>status-closed</cmd>") != std::string::npos);
}

static void test_other_paths_get_empty_body() {
    Fixture f;
    f.state.set(DoorState::Closed);
    TEST_ASSERT_TRUE(f.endpoint.handlePoll("/", "192.168.1.10").empty());
    TEST_ASSERT_TRUE(f.endpoint.handlePoll("/status/", "192.168.1.10").empty());
    TEST_ASSERT_TRUE(f.endpoint.handlePoll("/favicon.ico", "192.168.1.10").empty());
}

static void test_subscribe_registers_callback() {
    Fixture f;
    const auto body = f.endpoint.handleSubscribe(std::string("<http://192.168.1.10:39500/notify>"), 0);

    TEST_ASSERT_EQUAL_STRING(OPEN_BODY, body.c_str());
    TEST_ASSERT_EQUAL(1, f.registry.size());
    TEST_ASSERT_TRUE(f.registry.expirationOf("http://192.168.1.10:39500/notify").has_value());
}

static void test_subscribe_twice_refreshes() {
    Fixture f;
    f.endpoint.handleSubscribe(std::string("<http://hub/notify>"), 0);
    f.endpoint.handleSubscribe(std::string("<http://hub/notify>"), 1000);

    TEST_ASSERT_EQUAL(1, f.registry.size());
    TEST_ASSERT_TRUE(*f.registry.expirationOf("http://hub/notify") == 1000 + SUBSCRIPTION_TTL_US);
}

static void test_subscribe_without_callback_only_returns_status() {
    Fixture f;
    f.state.set(DoorState::Closed);
    const auto body = f.endpoint.handleSubscribe(std::nullopt, 0);

    TEST_ASSERT_TRUE(body.find("status-closed") != std::string::npos);
    TEST_ASSERT_EQUAL(0, f.registry.size());

    f.endpoint.handleSubscribe(std::string("<>"), 0);
    TEST_ASSERT_EQUAL(0, f.registry.size());
}

static void test_parse_callback_header() {
    TEST_ASSERT_EQUAL_STRING("http://hub/notify", StatusEndpoint::parseCallbackHeader("<http://hub/notify>")->c_str());
    TEST_ASSERT_EQUAL_STRING("http://hub/notify", StatusEndpoint::parseCallbackHeader("  <http://hub/notify>  ")->c_str());
    TEST_ASSERT_EQUAL_STRING("http://a/1", StatusEndpoint::parseCallbackHeader("<http://a/1><http://b/2>")->c_str());
    TEST_ASSERT_EQUAL_STRING("http://hub/notify", StatusEndpoint::parseCallbackHeader("http://hub/notify")->c_str());
    TEST_ASSERT_FALSE(StatusEndpoint::parseCallbackHeader("").has_value());
    TEST_ASSERT_FALSE(StatusEndpoint::parseCallbackHeader("<>").has_value());
}

void run_status_endpoint_tests() {
    RUN_TEST(test_poll_status_before_first_reading);
    RUN_TEST(test_poll_status_closed);
    RUN_TEST(test_other_paths_get_empty_body);
    RUN_TEST(test_subscribe_registers_callback);
    RUN_TEST(test_subscribe_twice_refreshes);
    RUN_TEST(test_subscribe_without_callback_only_returns_status);
    RUN_TEST(test_parse_callback_header);
}
