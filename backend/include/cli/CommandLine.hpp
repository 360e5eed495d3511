#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/ServerConfig.hpp"

namespace extronctl {

class DeviceDriver;

namespace cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitUsage = 2;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> remote;
    std::optional<std::string> device;
    std::optional<std::string> config_file;
    std::optional<std::string> grace_ms;
    // --debug DIR: verbose logging, and for the server a log file in DIR
    std::optional<std::string> debug_dir;
    bool no_daemonize = false;
};

// args[0] is the command; throws UsageError.
Args parse_args(const std::vector<std::string>& args);

// Defaults < config file < environment < flags.
ServerConfig load_config(const Args& a);

/**
 * @brief The extronctl command line: list, select, server, rescan, stop_server.
 *
 * Output goes to the streams given at construction. run() returns the process
 * exit code: 0 on success, 1 when the command failed, 2 on a usage error.
 */
class CommandLine {
public:
    using DriverFactory = std::function<std::unique_ptr<DeviceDriver>(const ServerConfig&)>;

    CommandLine(std::ostream& out, std::ostream& err);

    // Local commands and the server build their driver through this; the
    // default is the Extron serial driver.
    void set_driver_factory(DriverFactory factory);

    // args[0] is the program name.
    int run(const std::vector<std::string>& args);

private:
    int dispatch(const Args& a);
    int cmd_list(const Args& a);
    int cmd_select(const Args& a);
    int cmd_server(const Args& a);
    int cmd_rescan(const Args& a);
    int cmd_stop_server(const Args& a);

    void print_usage(const std::string& prog);
    template <typename DeviceT>
    void print_devices(const std::vector<DeviceT>& devices);

    std::ostream& out;
    std::ostream& err;
    DriverFactory make_driver;
};

} // namespace cli
} // namespace extronctl
