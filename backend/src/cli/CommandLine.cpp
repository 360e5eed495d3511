#include "cli/CommandLine.hpp"
#include "CommandDispatcher.hpp"
#include "DeviceRegistry.hpp"
#include "WebSocketServer.hpp"
#include "core/BuildInfo.hpp"
#include "core/ControlError.hpp"
#include "core/LogSink.hpp"
#include "driver/ExtronSerialDriver.hpp"
#include "extronctl_api.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace extronctl::cli {

namespace {

std::string take_value(const std::vector<std::string>& args, std::size_t& i, const std::string& flag) {
    if (i + 1 >= args.size()) throw UsageError(flag + " requires a value");
    return args[++i];
}

void validate_address(const std::string& addr) {
    std::string host;
    unsigned short port = 0;
    if (!parse_host_port(addr, host, port)) {
        throw UsageError("'" + addr + "' does not contain a valid address");
    }
}

// Local operation: driver, registry and dispatcher built the way the server
// builds them, with an initial scan.
struct LocalStack {
    std::unique_ptr<DeviceDriver> driver;
    DeviceRegistry registry;
    CommandDispatcher dispatcher;

    explicit LocalStack(std::unique_ptr<DeviceDriver> d)
    : driver(std::move(d)), registry(*driver), dispatcher(registry, *driver) {
        try {
            registry.rescan();
        } catch (const DiscoveryError& e) {
            std::cerr << e.what() << std::endl;
        }
    }
};

void fail_errno(const std::string& what) {
    throw std::runtime_error(what + ": " + std::strerror(errno));
}

// Detach from the terminal, then run as daemon:dialout when started as root.
// Must happen before any thread is started.
void daemonize() {
    if (::daemon(0, 0) != 0) fail_errno("daemonize");
    ::umask(0);
    if (::geteuid() != 0) return;

    const passwd* user = ::getpwnam("daemon");
    const group* grp = ::getgrnam("dialout");
    if (!user || !grp) throw std::runtime_error("daemonize: user 'daemon' or group 'dialout' does not exist");
    if (::setgroups(0, nullptr) != 0) fail_errno("setgroups");
    if (::setgid(grp->gr_gid) != 0) fail_errno("setgid");
    if (::setuid(user->pw_uid) != 0) fail_errno("setuid");
}

} // namespace

Args parse_args(const std::vector<std::string>& args) {
    if (args.empty()) throw UsageError("missing command");
    Args a;
    a.command = args[0];
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& s = args[i];
        if (s == "-r" || s == "--remote") a.remote = take_value(args, i, s);
        else if (s.rfind("--remote=", 0) == 0) a.remote = s.substr(9);
        else if (s == "-d" || s == "--device") a.device = take_value(args, i, s);
        else if (s.rfind("--device=", 0) == 0) a.device = s.substr(9);
        else if (s == "-c" || s == "--config") a.config_file = take_value(args, i, s);
        else if (s.rfind("--config=", 0) == 0) a.config_file = s.substr(9);
        else if (s == "-g" || s == "--grace-ms") a.grace_ms = take_value(args, i, s);
        else if (s.rfind("--grace-ms=", 0) == 0) a.grace_ms = s.substr(11);
        else if (s == "--debug") a.debug_dir = take_value(args, i, s);
        else if (s.rfind("--debug=", 0) == 0) a.debug_dir = s.substr(8);
        else if (s == "--no-daemonize") a.no_daemonize = true;
        else if (s.size() > 1 && s[0] == '-') throw UsageError("unknown option " + s);
        else a.positional.push_back(s);
    }
    if (a.debug_dir && a.debug_dir->empty()) throw UsageError("--debug requires a directory");
    return a;
}

ServerConfig load_config(const Args& a) {
    ServerConfig cfg;
    std::string file = a.config_file ? *a.config_file : config_path_from_env();
    if (!file.empty()) cfg.apply_file(file);
    cfg.apply_env();
    if (a.grace_ms) {
        long long ms = -1;
        std::size_t used = 0;
        try {
            ms = std::stoll(*a.grace_ms, &used);
        } catch (const std::logic_error&) {
            throw UsageError("--grace-ms expects a number of milliseconds");
        }
        if (ms < 0 || used != a.grace_ms->size()) throw UsageError("--grace-ms expects a number of milliseconds");
        cfg.grace = std::chrono::milliseconds(ms);
    }
    if (a.debug_dir) {
        cfg.debug = true;
        cfg.log_dir = *a.debug_dir;
    }
    return cfg;
}

CommandLine::CommandLine(std::ostream& o, std::ostream& e)
: out(o), err(e),
  make_driver([](const ServerConfig& c) -> std::unique_ptr<DeviceDriver> {
      return std::make_unique<ExtronSerialDriver>(c.serial, c.discovery, c.debug);
  }) {}

void CommandLine::set_driver_factory(DriverFactory factory) {
    make_driver = std::move(factory);
}

void CommandLine::print_usage(const std::string& prog) {
    out << "Usage: " << prog << " <command> [options]\n"
        << "Control Extron scalers/switchers\n\n"
        << "Commands:\n"
        << "  list [-r ADDR]                     list available devices\n"
        << "  select [-d NAME] INPUT [-r ADDR]   select input\n"
        << "  server [ADDR] [options]            run as server (default 0.0.0.0:14000)\n"
        << "      -c, --config FILE              JSON config file (or EXTRONCTL_CONFIG)\n"
        << "      -g, --grace-ms N               shutdown grace period\n"
        << "      --debug DIR                    debug logging to DIR/extronctl.log\n"
        << "      --no-daemonize                 stay in the foreground, log to the terminal\n"
        << "  rescan ADDR                        force rescan on server\n"
        << "  stop_server ADDR                   halt server\n\n"
        << "Options:\n"
        << "  -h, --help                         Show this help message and exit\n"
        << "  -V, --version                      Show version and exit\n"
        << std::flush;
}

template <typename DeviceT>
void CommandLine::print_devices(const std::vector<DeviceT>& devices) {
    out << std::left << std::setw(32) << "Name" << "Device\n";
    for (const auto& d : devices) {
        out << std::left << std::setw(32) << d.name << d.path << "\n";
    }
    out << std::flush;
}

int CommandLine::run(const std::vector<std::string>& args) {
    const std::string prog = args.empty() ? std::string("extronctl") : args[0];
    if (args.size() < 2) {
        print_usage(prog);
        return kExitUsage;
    }
    const std::string& first = args[1];
    if (first == "-h" || first == "--help") {
        print_usage(prog);
        return kExitOk;
    }
    if (first == "-V" || first == "--version") {
        out << "extronctl " << buildinfo::version()
            << " (" << buildinfo::git_commit() << ", built "
            << buildinfo::build_time_utc_approx() << ")" << std::endl;
        return kExitOk;
    }

    try {
        return dispatch(parse_args(std::vector<std::string>(args.begin() + 1, args.end())));
    } catch (const UsageError& e) {
        err << "error: " << e.what() << "\n\n";
        print_usage(prog);
        return kExitUsage;
    } catch (const std::exception& e) {
        err << e.what() << std::endl;
        return kExitError;
    }
}

int CommandLine::dispatch(const Args& a) {
    if (a.command == "list") return cmd_list(a);
    if (a.command == "select") return cmd_select(a);
    if (a.command == "server") return cmd_server(a);
    if (a.command == "rescan") return cmd_rescan(a);
    if (a.command == "stop_server") return cmd_stop_server(a);
    throw UsageError("unknown command '" + a.command + "'");
}

int CommandLine::cmd_list(const Args& a) {
    if (a.remote) {
        validate_address(*a.remote);
        Client remote(*a.remote);
        print_devices(remote.list_devices());
        return kExitOk;
    }
    LocalStack local(make_driver(load_config(a)));
    print_devices(local.dispatcher.list_devices());
    return kExitOk;
}

int CommandLine::cmd_select(const Args& a) {
    if (a.positional.size() != 1) throw UsageError("select requires exactly one INPUT");
    const std::string& input = a.positional.front();

    if (a.remote) {
        validate_address(*a.remote);
        if (!a.device) throw UsageError("--device is required with --remote");
        Client remote(*a.remote);
        remote.select_input(*a.device, input);
        return kExitOk;
    }

    LocalStack local(make_driver(load_config(a)));
    std::string name;
    if (a.device) {
        name = *a.device;
    } else {
        auto devices = local.registry.list();
        if (devices.size() != 1) throw UsageError("--device is required unless exactly one device is attached");
        name = devices.front().name;
    }
    local.dispatcher.select_input(name, input);
    return kExitOk;
}

int CommandLine::cmd_server(const Args& a) {
    auto cfg = load_config(a);
    if (a.positional.size() > 1) throw UsageError("server takes at most one ADDR");
    if (!a.positional.empty()) {
        validate_address(a.positional.front());
        cfg.set_listen(a.positional.front());
    }

    LogOptions log;
    if (!cfg.log_dir.empty()) log.directory = std::filesystem::absolute(cfg.log_dir).string();
    if (!a.no_daemonize) {
        daemonize();
        log.syslog = true;
        log.console = false;
    }
    std::unique_ptr<LogRedirect> redirect;
    if (!log.directory.empty() || log.syslog) redirect = std::make_unique<LogRedirect>(log);

    auto driver = make_driver(cfg);
    DeviceRegistry registry(*driver);
    try {
        registry.rescan();
    } catch (const DiscoveryError& e) {
        std::cerr << "Initial scan failed, starting with no devices: " << e.what() << std::endl;
    }

    CommandDispatcher dispatcher(registry, *driver);
    WebSocketServer server(cfg, dispatcher);
    dispatcher.set_stop_handler([&server]() { server.request_stop(); });

    server.start();
    out << "extronctl server listening on " << cfg.listen_host << ":" << server.port() << std::endl;
    server.wait();
    out << "Server halted" << std::endl;
    return kExitOk;
}

int CommandLine::cmd_rescan(const Args& a) {
    if (a.positional.size() != 1) throw UsageError("rescan requires ADDR");
    validate_address(a.positional.front());
    Client remote(a.positional.front());
    remote.rescan();
    print_devices(remote.list_devices());
    return kExitOk;
}

int CommandLine::cmd_stop_server(const Args& a) {
    if (a.positional.size() != 1) throw UsageError("stop_server requires ADDR");
    validate_address(a.positional.front());
    Client remote(a.positional.front());
    remote.stop_server();
    return kExitOk;
}

} // namespace extronctl::cli
