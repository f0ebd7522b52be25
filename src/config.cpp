#include "resguard/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <string_view>
#include <utility>

namespace resguard {

namespace {

using ParseResult = Result<DemoConfig, std::string>;

bool parse_non_negative(const std::string& text, long max, long& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || value < 0 || value > max) {
        return false;
    }
    out = value;
    return true;
}

bool takes_value(std::string_view name) {
    return name == "dir" || name == "host" || name == "port" || name == "user" ||
           name == "connect-delay-ms" || name == "query-delay-ms";
}

} // namespace

const char* demo_usage() {
    return "usage: resguard_demo [options]\n"
           "  --dir <path>             directory for the demo files (default .)\n"
           "  --host <name>            database host (default servidor.empresa.com)\n"
           "  --port <n>               database port (default 3306)\n"
           "  --user <name>            database user (default desarrollo)\n"
           "  --connect-delay-ms <n>   simulated connect latency (default 500)\n"
           "  --query-delay-ms <n>     simulated query latency (default 100)\n"
           "  --quiet                  suppress lifecycle event lines\n"
           "  --help                   show this text\n";
}

Result<DemoConfig, std::string> parse_demo_args(int argc, const char* const* argv) {
    DemoConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.size() < 3 || arg.substr(0, 2) != "--") {
            return ParseResult::Err("unexpected argument '" + std::string(arg) + "'");
        }

        std::string_view name = arg.substr(2);
        std::string value;
        bool has_value = false;
        auto equal_pos = name.find('=');
        if (equal_pos != std::string_view::npos) {
            value = std::string(name.substr(equal_pos + 1));
            name = name.substr(0, equal_pos);
            has_value = true;
        }

        if (name == "quiet" || name == "help") {
            if (has_value) {
                return ParseResult::Err("--" + std::string(name) + " takes no value");
            }
            if (name == "quiet") {
                config.quiet = true;
            } else {
                config.show_help = true;
            }
            continue;
        }

        if (!takes_value(name)) {
            return ParseResult::Err("unknown option '--" + std::string(name) + "'");
        }
        if (!has_value) {
            if (i + 1 >= argc) {
                return ParseResult::Err("--" + std::string(name) + " needs a value");
            }
            value = argv[++i];
        }

        long number = 0;
        if (name == "dir") {
            if (value.empty()) {
                return ParseResult::Err("--dir needs a non-empty path");
            }
            config.directory = value;
        } else if (name == "host") {
            config.database.host = value;
        } else if (name == "user") {
            config.database.user = value;
        } else if (name == "port") {
            if (!parse_non_negative(value, 65535, number) || number == 0) {
                return ParseResult::Err("--port expects 1..65535, got '" + value + "'");
            }
            config.database.port = static_cast<int>(number);
        } else if (name == "connect-delay-ms") {
            if (!parse_non_negative(value, 60000, number)) {
                return ParseResult::Err("--connect-delay-ms expects 0..60000, got '" + value + "'");
            }
            config.connect_delay = std::chrono::milliseconds(number);
        } else if (name == "query-delay-ms") {
            if (!parse_non_negative(value, 60000, number)) {
                return ParseResult::Err("--query-delay-ms expects 0..60000, got '" + value + "'");
            }
            config.query_delay = std::chrono::milliseconds(number);
        }
    }

    return ParseResult::Ok(std::move(config));
}

} // namespace resguard
