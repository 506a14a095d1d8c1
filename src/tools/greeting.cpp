/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "tools/greeting.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace gv::tools {

    namespace {
        std::string to_upper_ascii(std::string_view text) {
            std::string result(text);
            std::ranges::transform(result, result.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return result;
        }
    } // namespace

    std::vector<std::string> build_greeting_lines(std::string_view name, uint32_t count, bool uppercase) {
        const std::string message = uppercase
                                        ? std::format("HELLO, {}!", to_upper_ascii(name))
                                        : std::format("Hello, {}!", name);

        std::vector<std::string> lines;
        lines.reserve(count);
        for (uint32_t i = 1; i <= count; ++i) {
            lines.push_back(count > 1 ? std::format("{} ({})", message, i) : message);
        }
        return lines;
    }

} // namespace gv::tools
