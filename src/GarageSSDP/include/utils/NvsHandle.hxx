// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_NVSHANDLE_HXX
#define GARAGESSDP_NVSHANDLE_HXX
#include <esp_log.h>
#include <nvs.h>

namespace garageSSDP::utils {

    // Owns an open NVS namespace; remembers the open error for the caller.
    class NvsHandle {
    public:
        NvsHandle(const char* ns, const nvs_open_mode_t mode) {
            m_open_err = nvs_open(ns, mode, &m_handle);
            if (m_open_err != ESP_OK) {
                ESP_LOGE("NvsHandle", "Cannot open namespace '%s': %s", ns, esp_err_to_name(m_open_err));
                m_handle = 0;
            }
        }

        ~NvsHandle() {
            if (m_handle) {
                nvs_close(m_handle);
            }
        }

        NvsHandle(const NvsHandle&) = delete;
        NvsHandle& operator=(const NvsHandle&) = delete;

        [[nodiscard]] nvs_handle_t get() const { return m_handle; }
        [[nodiscard]] esp_err_t openError() const { return m_open_err; }
        explicit operator bool() const { return m_handle != 0; }

        [[nodiscard]] esp_err_t commit() const {
            return m_handle ? nvs_commit(m_handle) : ESP_ERR_NVS_INVALID_HANDLE;
        }

    private:
        nvs_handle_t m_handle{0};
        esp_err_t m_open_err{ESP_OK};
    };
}

#endif //GARAGESSDP_NVSHANDLE_HXX
