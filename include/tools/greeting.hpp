/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gv::tools {

    inline constexpr std::string_view DEFAULT_GREETING_NAME = "World";

    // "Hello, <name>!" or "HELLO, <NAME>!"; lines are numbered " (i)" when count > 1
    std::vector<std::string> build_greeting_lines(std::string_view name, uint32_t count, bool uppercase);

} // namespace gv::tools
