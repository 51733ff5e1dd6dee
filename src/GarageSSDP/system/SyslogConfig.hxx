// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_SYSLOGCONFIG_HXX
#define GARAGESSDP_SYSLOGCONFIG_HXX

#include <freertos/message_buffer.h>

namespace garageSSDP {
    /**
     * @brief Mirrors every esp_log line to a remote syslog server over UDP.
     *
     * Lines are queued from the logging call site and sent by a background task.
     */
    class SyslogConfig {
        public:
            SyslogConfig(const SyslogConfig&) = delete;
            SyslogConfig& operator=(const SyslogConfig&) = delete;

            static SyslogConfig& Instance() {
                static SyslogConfig instance;
                return instance;
            }

            esp_err_t init(const std::string& server_addr);
            void setServer(const std::string& server_addr);

            // Packet text for one log line: "<14>garage2ssdp: " + message without trailing newlines.
            static std::string formatPacket(std::string_view message);

        private:
            SyslogConfig() = default;
            static int syslog_vprintf_func(const char *format, va_list args);
            static void syslog_task_entry(void* arg);
            [[noreturn]] void syslog_task_runner();
            void send_log_udp(std::string_view message);
            std::string m_server_addr;
            int m_sock {-1};
            vprintf_like_t m_original_logger {nullptr};
            std::recursive_mutex m_sock_mutex;
            bool m_initialized {false};
            MessageBufferHandle_t m_log_buffer {nullptr};
            TaskHandle_t m_task_handle {nullptr};
    };
} // garageSSDP

#endif //GARAGESSDP_SYSLOGCONFIG_HXX
