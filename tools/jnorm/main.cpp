/**
 * @file main.cpp
 * @brief jnorm CLI entry point
 *
 * Commands:
 *   canonicalize - Print the canonical form of a JSON document
 *   digest       - Print the digest of a JSON document's canonical form
 *   version      - Show version information
 */

#include "jnorm/canonical_json.hpp"
#include "jnorm/common.hpp"
#include "jnorm/digest.hpp"
#include "jnorm/value.hpp"
#include "jnorm/version.hpp"

#include <charconv>
#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

namespace {

void print_version()
{
    std::println("jnorm {} ({})", jnorm::kVersion, jnorm::kBuildId);
}

void print_help()
{
    std::print(R"(jnorm - Canonical JSON serializer

Usage: jnorm <command> [options]

Commands:
  canonicalize  Print the canonical form of a JSON document
  digest        Print the digest of a JSON document's canonical form
  version       Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'jnorm <command> --help' for command-specific options.
)");
}

void print_canonicalize_help()
{
    std::print(R"(Usage: jnorm canonicalize [options]

Print the canonical form of a JSON document

Options:
  --input FILE, -i          JSON document (default: stdin)
  --max-depth N             Maximum container nesting (default: 1024)
  --help, -h                Show this help
)");
}

void print_digest_help()
{
    std::print(R"(Usage: jnorm digest [options]

Print the digest of a JSON document's canonical form

Options:
  --algorithm NAME, -a      Digest algorithm: md5, sha256, sha512, ... (default: md5)
  --input FILE, -i          JSON document (default: stdin)
  --max-depth N             Maximum container nesting (default: 1024)
  --help, -h                Show this help
)");
}

struct CommandOptions
{
    std::string input;
    std::string algorithm{jnorm::digest::kDefaultAlgorithm};
    jnorm::canonical::Options canonical;
    bool show_help = false;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> jnorm::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            jnorm::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] jnorm::Result<std::size_t> parse_depth_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed == 0) {
        return std::unexpected(
            jnorm::Error::make("InvalidArgument",
                               std::string("Invalid --max-depth value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] jnorm::Result<CommandOptions> parse_command_args(std::span<char*> args,
                                                               bool accepts_algorithm)
{
    CommandOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--input" || arg == "-i") {
            auto value = read_option_value(args, i, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.input = *value;
            ++i;
            continue;
        }
        if (arg == "--max-depth") {
            auto value = read_option_value(args, i, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto depth = parse_depth_value(*value);
            if (!depth) {
                return std::unexpected(depth.error());
            }
            options.canonical.max_depth = *depth;
            ++i;
            continue;
        }
        if (accepts_algorithm && (arg == "--algorithm" || arg == "-a")) {
            auto value = read_option_value(args, i, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.algorithm = *value;
            ++i;
            continue;
        }
        return std::unexpected(
            jnorm::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

[[nodiscard]] jnorm::Result<jnorm::Value> read_input(const std::string& path, std::size_t max_depth)
{
    nlohmann::json payload;
    try {
        if (path.empty() || path == "-") {
            std::cin >> payload;
        } else {
            std::ifstream in(path);
            if (!in) {
                return std::unexpected(
                    jnorm::Error::make("IOError", "Failed to open JSON file: " + path));
            }
            in >> payload;
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(jnorm::Error::make(
            "ParseError",
            "Failed to parse JSON input " + (path.empty() ? std::string("<stdin>") : path) + ": "
                + ex.what()));
    }
    return jnorm::Value::from_json(payload, max_depth);
}

int run_canonicalize(const CommandOptions& options)
{
    auto value = read_input(options.input, options.canonical.max_depth);
    if (!value) {
        std::println(stderr, "Error: {}", value.error().message);
        return 1;
    }
    auto canonical = jnorm::canonical::canonicalize(*value, {}, options.canonical);
    if (!canonical) {
        std::println(stderr, "Error: canonicalize failed: {}", canonical.error().message);
        return 1;
    }
    // Parsed JSON always has a canonical form.
    std::println("{}", canonical->value_or(""));
    return 0;
}

int run_digest(const CommandOptions& options)
{
    auto value = read_input(options.input, options.canonical.max_depth);
    if (!value) {
        std::println(stderr, "Error: {}", value.error().message);
        return 1;
    }
    auto hex = jnorm::digest::digest(*value, options.algorithm, {}, options.canonical);
    if (!hex) {
        std::println(stderr, "Error: digest failed: {}", hex.error().message);
        return 1;
    }
    std::println("{}", *hex);
    return 0;
}

int cmd_canonicalize(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_command_args(args, false);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_canonicalize_help();
        return 0;
    }
    return run_canonicalize(*options);
}

int cmd_digest(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_command_args(args, true);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_digest_help();
        return 0;
    }
    return run_digest(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "canonicalize") {
            return cmd_canonicalize(sub_argc, sub_argv);
        }
        if (cmd == "digest") {
            return cmd_digest(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
