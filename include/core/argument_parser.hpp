/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <memory>

namespace gv {
    namespace args {
        /**
         * @brief Parse command-line arguments and load viewer parameters from JSON
         * @param argc Number of arguments
         * @param argv Array of argument strings (const-correct)
         * @return Expected ViewerParameters, nullptr when only help was requested, or error message
         */
        std::expected<std::unique_ptr<param::ViewerParameters>, std::string>
        parse_args_and_params(int argc, const char* const argv[]);
    } // namespace args
} // namespace gv
