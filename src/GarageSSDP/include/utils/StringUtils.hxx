// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_STRINGUTILS_HXX
#define GARAGESSDP_STRINGUTILS_HXX

namespace garageSSDP::utils {
    inline std::string stringFormat(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);

        va_list args_copy;
        va_copy(args_copy, args);
        const int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (len < 0) {
            va_end(args);
            return {};
        }

        std::vector<char> buf(len + 1);
        vsnprintf(buf.data(), len + 1, fmt, args);
        va_end(args);

        return {buf.data(), static_cast<size_t>(len)};
    }

    inline std::string_view trim(std::string_view sv) {
        constexpr std::string_view WS = " \t";
        const auto first = sv.find_first_not_of(WS);
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = sv.find_last_not_of(WS);
        return sv.substr(first, last - first + 1);
    }

    inline std::string toLower(std::string_view sv) {
        std::string out(sv);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // Splits on every occurrence of delim, keeping empty pieces.
    inline std::vector<std::string_view> split(std::string_view sv, std::string_view delim) {
        std::vector<std::string_view> parts;
        size_t pos = 0;
        while (true) {
            const auto next = sv.find(delim, pos);
            if (next == std::string_view::npos) {
                parts.push_back(sv.substr(pos));
                break;
            }
            parts.push_back(sv.substr(pos, next - pos));
            pos = next + delim.size();
        }
        return parts;
    }
}

#endif //GARAGESSDP_STRINGUTILS_HXX
