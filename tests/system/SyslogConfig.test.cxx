// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "system/SyslogConfig.hxx"

using namespace garageSSDP;

static void test_packet_has_priority_and_tag() {
    TEST_ASSERT_EQUAL_STRING("<14>garage2ssdp: I (123) GarageMonitor: State changed from open to closed",
                             SyslogConfig::formatPacket("I (123) GarageMonitor: State changed from open to closed\r\n").c_str());
}

static void test_blank_line_is_not_sent() {
    TEST_ASSERT_TRUE(SyslogConfig::formatPacket("\n").empty());
    TEST_ASSERT_TRUE(SyslogConfig::formatPacket("").empty());
}

static void test_long_line_is_truncated() {
    const std::string long_line(1000, 'x');
    const auto packet = SyslogConfig::formatPacket(long_line);
    TEST_ASSERT_EQUAL(strlen("<14>garage2ssdp: ") + 256, packet.size());
}

void run_syslog_tests() {
    RUN_TEST(test_packet_has_priority_and_tag);
    RUN_TEST(test_blank_line_is_not_sent);
    RUN_TEST(test_long_line_is_truncated);
}
