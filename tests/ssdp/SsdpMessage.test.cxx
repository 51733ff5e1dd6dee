// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "ssdp/SsdpMessage.hxx"

using namespace garageSSDP;

static void test_parse_msearch() {
    const auto msg = SsdpMessage::parseRequest(
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: 4\r\n"
        "ST: urn:schemas-upnp-org:device:RPi_Garage_Monitor:1\r\n"
        "\r\n");

    TEST_ASSERT_TRUE(msg.has_value());
    TEST_ASSERT_EQUAL(3, msg->start_line.size());
    TEST_ASSERT_EQUAL_STRING("M-SEARCH", msg->start_line[0].c_str());
    TEST_ASSERT_EQUAL_STRING("*", msg->start_line[1].c_str());
    TEST_ASSERT_EQUAL_STRING("urn:schemas-upnp-org:device:RPi_Garage_Monitor:1", msg->header("ST")->c_str());
    TEST_ASSERT_EQUAL_STRING("239.255.255.250:1900", msg->header("host")->c_str());
    TEST_ASSERT_EQUAL_STRING("\"ssdp:discover\"", msg->header("Man")->c_str());
}

static void test_header_value_keeps_later_colons() {
    const auto msg = SsdpMessage::parseRequest("NOTIFY * HTTP/1.1\r\nLOCATION:http://10.0.0.2:8080/x\r\n\r\n");
    TEST_ASSERT_TRUE(msg.has_value());
    TEST_ASSERT_EQUAL_STRING("http://10.0.0.2:8080/x", msg->header("location")->c_str());
    TEST_ASSERT_FALSE(msg->header("st").has_value());
}

static void test_missing_terminator_is_malformed() {
    TEST_ASSERT_FALSE(SsdpMessage::parseRequest("M-SEARCH * HTTP/1.1\r\nST: ssdp:all\r\n").has_value());
    TEST_ASSERT_FALSE(SsdpMessage::parseRequest("").has_value());
}

static void test_short_start_line_is_malformed() {
    TEST_ASSERT_FALSE(SsdpMessage::parseRequest("M-SEARCH\r\nST: x\r\n\r\n").has_value());
}

static void test_header_without_colon_is_malformed() {
    TEST_ASSERT_FALSE(SsdpMessage::parseRequest("M-SEARCH * HTTP/1.1\r\nGARBAGE\r\n\r\n").has_value());
}

static void test_parse_search_response_block() {
    const auto msg = SsdpMessage::parseBlock(
        "HTTP/1.1 200 OK\r\nCACHE-CONTROL:max-age=30\r\nEXT:\r\nST:urn:x");
    TEST_ASSERT_TRUE(msg.has_value());
    TEST_ASSERT_EQUAL_STRING("200", msg->start_line[1].c_str());
    TEST_ASSERT_EQUAL_STRING("", msg->header("ext")->c_str());
    TEST_ASSERT_EQUAL_STRING("max-age=30", msg->header("cache-control")->c_str());
}

void run_ssdp_message_tests() {
    RUN_TEST(test_parse_msearch);
    RUN_TEST(test_header_value_keeps_later_colons);
    RUN_TEST(test_missing_terminator_is_malformed);
    RUN_TEST(test_short_start_line_is_malformed);
    RUN_TEST(test_header_without_colon_is_malformed);
    RUN_TEST(test_parse_search_response_block);
}
