// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef PCH_HXX
#define PCH_HXX

// Standard C++ library headers
#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
// C headers
#ifdef __cplusplus
extern "C" {
#endif

#include <esp_log.h>
#include <esp_err.h>
#include <esp_event.h>
#include <esp_timer.h>
#include <nvs_flash.h>
#include <nvs.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <cJSON.h>

#ifdef __cplusplus
}
#endif

#endif //PCH_HXX
