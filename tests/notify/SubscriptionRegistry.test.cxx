// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "notify/SubscriptionRegistry.hxx"

using namespace garageSSDP;

static constexpr TimestampUs HOUR_US = 3600LL * 1000 * 1000;

static void test_new_subscription_expires_after_a_day() {
    SubscriptionRegistry registry;
    TEST_ASSERT_EQUAL(SubscribeResult::Added, registry.subscribe("http://192.168.1.10:39500/notify", 1000));

    const auto expiration = registry.expirationOf("http://192.168.1.10:39500/notify");
    TEST_ASSERT_TRUE(expiration.has_value());
    TEST_ASSERT_TRUE(*expiration == 1000 + 24 * HOUR_US);
    TEST_ASSERT_EQUAL(1, registry.size());
}

static void test_resubscribe_refreshes_instead_of_duplicating() {
    SubscriptionRegistry registry;
    registry.subscribe("http://hub/notify", 0);
    TEST_ASSERT_EQUAL(SubscribeResult::Refreshed, registry.subscribe("http://hub/notify", 10 * HOUR_US));

    TEST_ASSERT_EQUAL(1, registry.size());
    TEST_ASSERT_TRUE(*registry.expirationOf("http://hub/notify") == 34 * HOUR_US);
}

static void test_expired_entries_are_skipped_but_kept() {
    SubscriptionRegistry registry;
    registry.subscribe("http://old/notify", 0);
    registry.subscribe("http://new/notify", 12 * HOUR_US);

    auto active = registry.activeSubscribers(30 * HOUR_US);
    TEST_ASSERT_EQUAL(1, active.size());
    TEST_ASSERT_EQUAL_STRING("http://new/notify", active[0].c_str());
    TEST_ASSERT_EQUAL(2, registry.size());

    registry.subscribe("http://old/notify", 30 * HOUR_US);
    active = registry.activeSubscribers(30 * HOUR_US);
    TEST_ASSERT_EQUAL(2, active.size());
}

static void test_entry_expiring_exactly_now_is_inactive() {
    SubscriptionRegistry registry;
    registry.subscribe("http://hub/notify", 0);
    TEST_ASSERT_EQUAL(1, registry.activeSubscribers(24 * HOUR_US - 1).size());
    TEST_ASSERT_EQUAL(0, registry.activeSubscribers(24 * HOUR_US).size());
}

static void test_unknown_address_has_no_expiration() {
    const SubscriptionRegistry registry;
    TEST_ASSERT_FALSE(registry.expirationOf("http://nobody/").has_value());
    TEST_ASSERT_EQUAL(0, registry.activeSubscribers(0).size());
}

void run_subscription_registry_tests() {
    RUN_TEST(test_new_subscription_expires_after_a_day);
    RUN_TEST(test_resubscribe_refreshes_instead_of_duplicating);
    RUN_TEST(test_expired_entries_are_skipped_but_kept);
    RUN_TEST(test_entry_expiring_exactly_now_is_inactive);
    RUN_TEST(test_unknown_address_has_no_expiration);
}
