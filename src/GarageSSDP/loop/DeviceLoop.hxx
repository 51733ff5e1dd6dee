// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_DEVICELOOP_HXX
#define GARAGESSDP_DEVICELOOP_HXX

namespace garageSSDP {

    /**
     * @brief Single task that runs every piece of work touching door state or subscriptions.
     *
     * Work items run one at a time in the order they were posted, so handlers
     * never observe each other half way through.
     */
    class DeviceLoop {
        public:
            using Work = std::function<void()>;

            DeviceLoop() = default;
            ~DeviceLoop();
            DeviceLoop(const DeviceLoop&) = delete;
            DeviceLoop& operator=(const DeviceLoop&) = delete;

            esp_err_t init(size_t queue_length = 32);

            /**
             * @brief Hand work over to the loop task. Never blocks.
             * @return false when the loop is not running or its queue is full.
             */
            bool post(Work work) const;

            [[nodiscard]] bool isLoopTask() const;
            [[nodiscard]] bool isRunning() const { return m_queue != nullptr; }

        private:
            [[noreturn]] static void LoopTask(void* arg);

            QueueHandle_t m_queue{nullptr};
            TaskHandle_t m_task{nullptr};
    };
} // garageSSDP

#endif //GARAGESSDP_DEVICELOOP_HXX
