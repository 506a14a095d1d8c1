/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include <args.hxx>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <print>

namespace {

    /**
     * @brief Get the path to a configuration file shipped next to the installation
     * @param filename Name of the configuration file
     * @return std::filesystem::path Full path to the configuration file
     */
    std::filesystem::path get_config_path(const std::string& filename) {
        std::error_code ec;
        std::filesystem::path executablePath = std::filesystem::canonical("/proc/self/exe", ec);
        if (ec) {
            return std::filesystem::path("parameter") / filename;
        }
        // Binaries live in <root>/build, configuration in <root>/parameter
        std::filesystem::path searchDir = executablePath.parent_path().parent_path();
        return searchDir / "parameter" / filename;
    }

    enum class ParseResult {
        Success,
        Help
    };

    struct CommandLine {
        std::optional<std::string> asset_file;
        std::optional<std::string> config_file;
        std::optional<int> width;
        std::optional<int> height;
        std::optional<std::string> overflow_policy;
        bool placeholder_on_failure = false;
    };

    std::expected<std::tuple<ParseResult, CommandLine>, std::string> parse_arguments(
        const std::vector<std::string>& args) {

        try {
            ::args::ArgumentParser parser(
                "glTF Viewer: renders the meshes of a glTF 2.0 asset with an orbiting camera.\n",
                "Usage:\n"
                "  gltf_viewer [--file <asset.glb|asset.gltf>] [options]\n"
                "Without --file a placeholder cube is shown. Drop a file on the window to load it.\n");

            ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});

            ::args::ValueFlag<std::string> asset_file(parser, "asset", "glTF asset to load (.glb or .gltf)", {'f', "file"});
            ::args::ValueFlag<std::string> config_file(parser, "config_file", "Viewer config file (json)", {"config"});

            ::args::ValueFlag<int> width(parser, "width", "Window width in px", {"width"});
            ::args::ValueFlag<int> height(parser, "height", "Window height in px", {"height"});
            ::args::ValueFlag<std::string> overflow_policy(parser, "policy",
                                                           "Index overflow policy: skip, clamp (default: skip)",
                                                           {"index-overflow"});
            ::args::Flag placeholder_on_failure(parser, "placeholder_on_failure",
                                                "Show the placeholder cube when an asset cannot be decoded",
                                                {"placeholder-on-failure"});

            // Logging options
            ::args::ValueFlag<std::string> log_level(parser, "level", "Log level: trace, debug, info, warn, error, critical, off (default: info)", {"log-level"});
            ::args::ValueFlag<std::string> log_file(parser, "file", "Optional log file path", {"log-file"});

            try {
                parser.Prog(args.front());
                parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
            } catch (const ::args::Help&) {
                std::print("{}", parser.Help());
                return std::make_tuple(ParseResult::Help, CommandLine{});
            } catch (const ::args::ParseError& e) {
                return std::unexpected(std::format("Parse error: {}\n{}", e.what(), parser.Help()));
            }

            // Initialize logger based on command line arguments
            {
                auto level = gv::core::LogLevel::Info;
                std::string log_file_path;

                if (log_level) {
                    auto parsed = gv::core::parse_log_level(::args::get(log_level));
                    if (!parsed) {
                        return std::unexpected(std::format("ERROR: unknown log level '{}'", ::args::get(log_level)));
                    }
                    level = *parsed;
                }
                if (log_file) {
                    log_file_path = ::args::get(log_file);
                }

                gv::core::Logger::get().init(level, log_file_path);

                LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
                if (!log_file_path.empty()) {
                    LOG_DEBUG("Logging to file: {}", log_file_path);
                }
            }

            CommandLine cmd;
            if (asset_file) {
                cmd.asset_file = ::args::get(asset_file);
                if (!std::filesystem::exists(*cmd.asset_file)) {
                    return std::unexpected(std::format("Asset file does not exist: {}", *cmd.asset_file));
                }
            }
            if (config_file) {
                cmd.config_file = ::args::get(config_file);
            }
            if (width) {
                cmd.width = ::args::get(width);
                if (*cmd.width <= 0) {
                    return std::unexpected("ERROR: --width must be greater than 0");
                }
            }
            if (height) {
                cmd.height = ::args::get(height);
                if (*cmd.height <= 0) {
                    return std::unexpected("ERROR: --height must be greater than 0");
                }
            }
            if (overflow_policy) {
                cmd.overflow_policy = ::args::get(overflow_policy);
                if (auto policy = gv::param::parse_index_overflow_policy(*cmd.overflow_policy); !policy) {
                    return std::unexpected(std::format("ERROR: {}", policy.error()));
                }
            }
            cmd.placeholder_on_failure = bool(placeholder_on_failure);

            return std::make_tuple(ParseResult::Success, std::move(cmd));

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Unexpected error during argument parsing: {}", e.what()));
        }
    }

    void apply_cmd_overrides(const CommandLine& cmd, gv::param::ViewerParameters& params) {
        auto setVal = [](const auto& flag, auto& target) {
            if (flag)
                target = *flag;
        };

        setVal(cmd.asset_file, params.asset_path);
        setVal(cmd.width, params.window.width);
        setVal(cmd.height, params.window.height);
        if (cmd.overflow_policy) {
            // already validated while parsing
            params.loading.index_overflow_policy = *gv::param::parse_index_overflow_policy(*cmd.overflow_policy);
        }
        if (cmd.placeholder_on_failure) {
            params.loading.placeholder_on_decode_failure = true;
        }
    }

    std::vector<std::string> convert_args(int argc, const char* const argv[]) {
        return std::vector<std::string>(argv, argv + argc);
    }
} // anonymous namespace

// Public interface
std::expected<std::unique_ptr<gv::param::ViewerParameters>, std::string>
gv::args::parse_args_and_params(int argc, const char* const argv[]) {

    auto parse_result = parse_arguments(convert_args(argc, argv));
    if (!parse_result) {
        return std::unexpected(parse_result.error());
    }

    auto [result, cmd] = *parse_result;

    // Handle help case
    if (result == ParseResult::Help) {
        return std::unique_ptr<gv::param::ViewerParameters>{};
    }

    auto params = std::make_unique<gv::param::ViewerParameters>();

    if (cmd.config_file) {
        auto params_result = gv::param::read_viewer_params_from_json(std::filesystem::u8path(*cmd.config_file));
        if (!params_result) {
            return std::unexpected(std::format("Failed to load viewer parameters: {}", params_result.error()));
        }
        *params = *params_result;
    } else {
        const auto default_config = get_config_path("viewer_params.json");
        if (std::filesystem::exists(default_config)) {
            auto params_result = gv::param::read_viewer_params_from_json(default_config);
            if (!params_result) {
                return std::unexpected(std::format("Failed to load viewer parameters: {}", params_result.error()));
            }
            *params = *params_result;
        } else {
            LOG_DEBUG("No viewer config at {}, using built-in defaults", default_config.string());
        }
    }

    apply_cmd_overrides(cmd, *params);

    if (auto valid = gv::param::validate(*params); !valid) {
        return std::unexpected(std::format("Invalid viewer parameters: {}", valid.error()));
    }

    return params;
}
