// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/SyslogConfig.hxx"
#include <lwip/sockets.h>
#include <lwip/netdb.h>

namespace garageSSDP {

    static constexpr char TAG[] = "SyslogService";
    static constexpr char SYSLOG_PORT[] = "514";
    static constexpr char SYSLOG_PREFIX[] = "<14>garage2ssdp: ";
    static constexpr size_t MESSAGE_BUFFER_SIZE = 4096;
    static constexpr size_t MAX_LOG_MSG_SIZE = 256;

    static SyslogConfig* g_syslog_instance = nullptr;

    esp_err_t SyslogConfig::init(const std::string& server_addr) {
        #if CONFIG_LOG_DEFAULT_LEVEL > 3
            ESP_LOGW(TAG, "IDF log level is set to DEBUG or VERBOSE. Syslog is disabled to prevent instability.");
            return ESP_ERR_NOT_SUPPORTED;
        #endif

        if (m_initialized) {
            setServer(server_addr);
            return ESP_OK;
        }

        g_syslog_instance = this;

        m_log_buffer = xMessageBufferCreate(MESSAGE_BUFFER_SIZE);
        if (!m_log_buffer) {
            ESP_LOGE(TAG, "Failed to create message buffer. Syslog disabled.");
            return ESP_ERR_NO_MEM;
        }

        if (xTaskCreate(syslog_task_entry, "syslog_task", 4096, this, 3, &m_task_handle) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create syslog task. Syslog disabled.");
            vMessageBufferDelete(m_log_buffer);
            m_log_buffer = nullptr;
            return ESP_ERR_NO_MEM;
        }

        m_original_logger = esp_log_set_vprintf(syslog_vprintf_func);
        m_initialized = true;

        setServer(server_addr);
        ESP_LOGI(TAG, "Syslog logger initialized, forwarding to %s:%s", server_addr.c_str(), SYSLOG_PORT);
        return ESP_OK;
    }

    void SyslogConfig::setServer(const std::string& server_addr) {
        std::lock_guard<std::recursive_mutex> lock(m_sock_mutex);

        if (m_sock >= 0) {
            close(m_sock);
            m_sock = -1;
        }
        m_server_addr = server_addr;

        if (m_server_addr.empty()) {
            ESP_LOGI(TAG, "Syslog server address is empty, remote logging is paused.");
            return;
        }

        addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        addrinfo *res = nullptr;

        if (const int err = getaddrinfo(m_server_addr.c_str(), SYSLOG_PORT, &hints, &res); err != 0 || res == nullptr) {
            ESP_LOGE(TAG, "DNS lookup failed for '%s': err=%d", m_server_addr.c_str(), err);
            return;
        }

        m_sock = socket(res->ai_family, res->ai_socktype, 0);
        if (m_sock < 0) {
            ESP_LOGE(TAG, "Failed to create socket: errno %d", errno);
        } else if (connect(m_sock, res->ai_addr, res->ai_addrlen) != 0) {
            ESP_LOGE(TAG, "Failed to connect socket: errno %d", errno);
            close(m_sock);
            m_sock = -1;
        }

        freeaddrinfo(res);
    }

    std::string SyslogConfig::formatPacket(std::string_view message) {
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.remove_suffix(1);
        }
        if (message.empty()) {
            return {};
        }
        if (message.size() > MAX_LOG_MSG_SIZE) {
            message = message.substr(0, MAX_LOG_MSG_SIZE);
        }

        std::string packet(SYSLOG_PREFIX);
        packet.append(message);
        return packet;
    }

    int SyslogConfig::syslog_vprintf_func(const char *format, va_list args) {
        int ret = 0;
        if (g_syslog_instance && g_syslog_instance->m_original_logger) {
            va_list args_copy;
            va_copy(args_copy, args);
            ret = g_syslog_instance->m_original_logger(format, args_copy);
            va_end(args_copy);
        }

        if (!g_syslog_instance || !g_syslog_instance->m_log_buffer) {
            return ret;
        }
        if (xPortInIsrContext()) {
            return ret;
        }
        if (xTaskGetCurrentTaskHandle() == g_syslog_instance->m_task_handle) {
            return ret;
        }

        char msg_buffer[192];
        const int len = vsnprintf(msg_buffer, sizeof(msg_buffer), format, args);

        if (len > 0) {
            const size_t actual_len = (static_cast<size_t>(len) < sizeof(msg_buffer)) ? len : (sizeof(msg_buffer) - 1);
            xMessageBufferSend(g_syslog_instance->m_log_buffer, msg_buffer, actual_len, 0);
        }

        return ret;
    }

    void SyslogConfig::syslog_task_entry(void* arg) {
        auto* self = static_cast<SyslogConfig*>(arg);
        self->syslog_task_runner();
    }

    void SyslogConfig::syslog_task_runner() {
        std::array<char, MAX_LOG_MSG_SIZE> recv_buffer{};

        while (true) {
            const size_t received_bytes = xMessageBufferReceive(
                m_log_buffer,
                recv_buffer.data(),
                recv_buffer.size(),
                portMAX_DELAY
            );

            if (received_bytes > 0) {
                send_log_udp(std::string_view(recv_buffer.data(), received_bytes));
            }
        }
    }

    void SyslogConfig::send_log_udp(const std::string_view message) {
        std::lock_guard<std::recursive_mutex> lock(m_sock_mutex);

        if (m_sock < 0 || m_server_addr.empty()) {
            return;
        }

        const std::string packet = formatPacket(message);
        if (packet.empty()) return;

        send(m_sock, packet.data(), packet.size(), 0);
    }

} // garageSSDP
