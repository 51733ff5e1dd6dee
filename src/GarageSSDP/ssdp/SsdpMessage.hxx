// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef GARAGESSDP_SSDPMESSAGE_HXX
#define GARAGESSDP_SSDPMESSAGE_HXX

namespace garageSSDP
{
    static constexpr char SSDP_MULTICAST_ADDR[] = "239.255.255.250";
    static constexpr uint16_t SSDP_PORT = 1900;
    static constexpr char SSDP_SEARCH_METHOD[] = "M-SEARCH";

    struct Endpoint {
        std::string host;
        uint16_t port{0};
    };

    /**
     * @brief One SSDP datagram: the start line split on spaces plus its headers.
     *
     * Header names are stored lower-cased; lookups are case-insensitive.
     */
    struct SsdpMessage {
        std::vector<std::string> start_line;
        std::map<std::string, std::string> headers;

        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

        /**
         * @brief Parse a request datagram ("METHOD TARGET ...", headers, blank line).
         * @return nullopt when the blank-line terminator is missing, the start line
         *         has fewer than two tokens, or a header line has no ':'.
         */
        static std::optional<SsdpMessage> parseRequest(std::string_view datagram);

        /**
         * @brief Parse a header block with no terminator requirement (search responses).
         */
        static std::optional<SsdpMessage> parseBlock(std::string_view block);
    };
} // garageSSDP

#endif //GARAGESSDP_SSDPMESSAGE_HXX
