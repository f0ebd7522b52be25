#ifndef RESGUARD_CONFIG_HPP
#define RESGUARD_CONFIG_HPP

#include <chrono>
#include <string>

#include "resguard/connector.hpp"
#include "resguard/result.hpp"

// @safe
namespace resguard {

// Settings for the demonstration program
struct DemoConfig {
    std::string directory;
    Endpoint database;
    std::chrono::milliseconds connect_delay;
    std::chrono::milliseconds query_delay;
    bool quiet;
    bool show_help;

    DemoConfig()
        : directory("."),
          database("servidor.empresa.com", 3306, "desarrollo"),
          connect_delay(500),
          query_delay(100),
          quiet(false),
          show_help(false) {}
};

// Accepts --name=value and --name value. Errors carry a one-line message.
//   --dir <path>  --host <name>  --port <n>  --user <name>
//   --connect-delay-ms <n>  --query-delay-ms <n>  --quiet  --help
Result<DemoConfig, std::string> parse_demo_args(int argc, const char* const* argv);

const char* demo_usage();

} // namespace resguard

#endif // RESGUARD_CONFIG_HPP
