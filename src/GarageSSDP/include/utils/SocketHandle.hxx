// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_SOCKETHANDLE_HXX
#define GARAGESSDP_SOCKETHANDLE_HXX
#include <lwip/sockets.h>

namespace garageSSDP::utils {

    // RAII wrapper for an lwIP socket descriptor
    class SocketHandle {
    public:
        SocketHandle() = default;
        explicit SocketHandle(const int fd) : m_fd(fd) {}

        ~SocketHandle() { reset(); }

        SocketHandle(SocketHandle&& other) noexcept : m_fd(other.release()) {}
        SocketHandle& operator=(SocketHandle&& other) noexcept {
            if (this != &other) {
                reset(other.release());
            }
            return *this;
        }

        SocketHandle(const SocketHandle&) = delete;
        SocketHandle& operator=(const SocketHandle&) = delete;

        [[nodiscard]] int get() const { return m_fd; }
        explicit operator bool() const { return m_fd >= 0; }

        int release() {
            const int fd = m_fd;
            m_fd = -1;
            return fd;
        }

        void reset(const int fd = -1) {
            if (m_fd >= 0) {
                close(m_fd);
            }
            m_fd = fd;
        }

    private:
        int m_fd{-1};
    };
}

#endif //GARAGESSDP_SOCKETHANDLE_HXX
