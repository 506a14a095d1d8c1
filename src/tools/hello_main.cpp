/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "tools/greeting.hpp"
#include <args.hxx>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    ::args::ArgumentParser parser("hello_cli: A simple Hello World CLI tool", "Version 0.1.0");
    ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});
    ::args::ValueFlag<std::string> name(parser, "NAME", "Name to greet", {'n', "name"});
    ::args::ValueFlag<uint32_t> count(parser, "NUMBER", "Number of times to greet (default: 1)", {'c', "count"}, 1);
    ::args::Flag uppercase(parser, "uppercase", "Display greeting in uppercase", {'u', "uppercase"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const ::args::Help&) {
        std::print("{}", parser.Help());
        return 0;
    } catch (const ::args::Error& e) {
        std::println(stderr, "Error: {}", e.what());
        std::print(stderr, "{}", parser.Help());
        return 1;
    }

    gv::core::Logger::get().init(gv::core::LogLevel::Warn);

    const std::string who = name ? ::args::get(name) : std::string(gv::tools::DEFAULT_GREETING_NAME);
    for (const auto& line : gv::tools::build_greeting_lines(who, ::args::get(count), uppercase)) {
        std::println("{}", line);
    }
    return 0;
}
