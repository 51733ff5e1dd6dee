// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "ssdp/SsdpMessage.hxx"
#include <utils/StringUtils.hxx>

namespace garageSSDP
{
    static constexpr std::string_view CRLF = "\r\n";
    static constexpr std::string_view HEADER_TERMINATOR = "\r\n\r\n";

    std::optional<std::string> SsdpMessage::header(const std::string_view name) const {
        if (const auto it = headers.find(utils::toLower(name)); it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<SsdpMessage> SsdpMessage::parseRequest(const std::string_view datagram) {
        const auto end = datagram.find(HEADER_TERMINATOR);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        return parseBlock(datagram.substr(0, end));
    }

    std::optional<SsdpMessage> SsdpMessage::parseBlock(const std::string_view block) {
        auto lines = utils::split(block, CRLF);

        SsdpMessage msg;
        for (const auto token : utils::split(lines.front(), " ")) {
            if (!token.empty()) {
                msg.start_line.emplace_back(token);
            }
        }
        if (msg.start_line.size() < 2) {
            return std::nullopt;
        }

        for (size_t i = 1; i < lines.size(); ++i) {
            const auto line = lines[i];
            if (line.empty()) continue;

            const auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                return std::nullopt;
            }
            msg.headers[utils::toLower(utils::trim(line.substr(0, colon)))] = std::string(utils::trim(line.substr(colon + 1)));
        }
        return msg;
    }
} // garageSSDP
