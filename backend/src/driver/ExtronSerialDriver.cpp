#include "driver/ExtronSerialDriver.hpp"
#include "core/ControlError.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/serial_port.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <termios.h>

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace extronctl {

namespace {

// Blocking line-oriented access to one serial port, with a read deadline.
class SerialLink {
public:
    SerialLink(const std::string& path, const SerialSettings& settings)
    : port_(ioc_), timeout_(settings.timeout) {
        using base = asio::serial_port_base;
        port_.open(path);
        port_.set_option(base::baud_rate(settings.baud_rate));
        port_.set_option(base::character_size(8));
        port_.set_option(base::parity(base::parity::none));
        port_.set_option(base::stop_bits(base::stop_bits::one));
        port_.set_option(base::flow_control(base::flow_control::none));
    }

    void clear() {
        if (::tcflush(port_.native_handle(), TCIOFLUSH) != 0) {
            throw boost::system::system_error(errno, boost::system::system_category(), "tcflush");
        }
        pending_.clear();
    }

    void write(const std::string& data) {
        asio::write(port_, asio::buffer(data));
    }

    // Next line including its terminator, or nullopt if none arrived in time.
    std::optional<std::string> read_line() {
        boost::system::error_code result;
        std::size_t length = 0;
        bool done = false;
        asio::async_read_until(port_, asio::dynamic_buffer(pending_), '\n',
            [&](const boost::system::error_code& ec, std::size_t n) {
                result = ec;
                length = n;
                done = true;
            });

        ioc_.restart();
        ioc_.run_for(timeout_);
        if (!done) {
            boost::system::error_code ignored;
            port_.cancel(ignored);
            ioc_.restart();
            ioc_.run();
            return std::nullopt;
        }
        if (result) throw boost::system::system_error(result);

        std::string line = pending_.substr(0, length);
        pending_.erase(0, length);
        return line;
    }

private:
    asio::io_context ioc_;
    asio::serial_port port_;
    std::chrono::milliseconds timeout_;
    std::string pending_;
};

std::string read_attribute(const fs::path& p) {
    std::ifstream f(p);
    std::string value;
    if (!f || !std::getline(f, value)) return {};
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.pop_back();
    return value;
}

// "02" and "2" name the same input
std::string strip_leading_zeros(const std::string& s) {
    auto first = s.find_first_not_of('0');
    if (first == std::string::npos) return s.empty() ? s : std::string("0");
    return s.substr(first);
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

ExtronSerialDriver::ExtronSerialDriver(SerialSettings serial, DiscoverySettings discovery, bool debug)
: serial_(std::move(serial)), discovery_(std::move(discovery)), debug_(debug) {}

std::string ExtronSerialDriver::name() const { return "extron-serial"; }

std::shared_ptr<std::mutex> ExtronSerialDriver::port_lock(const std::string& path) {
    std::lock_guard<std::mutex> lk(locks_m_);
    auto& slot = port_locks_[path];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

std::vector<std::string> ExtronSerialDriver::candidate_ports() const {
    std::error_code ec;
    fs::directory_iterator it(discovery_.sysfs_root, ec);
    if (ec) {
        throw DiscoveryError(std::string(errors::D3060_NO_SYSFS) + " (" + discovery_.sysfs_root + ": " + ec.message() + ")");
    }

    std::vector<std::string> out;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::path entry = it->path();
        std::error_code lec;
        fs::path dev = fs::canonical(entry / "device", lec);
        if (lec) continue;

        // tty -> USB interface -> USB device; idVendor lives on the device node
        bool found = false;
        for (int depth = 0; depth < 4; ++depth) {
            if (fs::exists(dev / "idVendor", lec)) {
                found = true;
                break;
            }
            if (!dev.has_parent_path() || dev.parent_path() == dev) break;
            dev = dev.parent_path();
        }
        if (!found) continue;

        std::string vid_text = read_attribute(dev / "idVendor");
        unsigned long vid = 0;
        try {
            vid = std::stoul(vid_text, nullptr, 16);
        } catch (const std::logic_error&) {
            continue;
        }
        if (vid != discovery_.vendor_id) continue;
        if (read_attribute(dev / "manufacturer") != discovery_.manufacturer) continue;

        out.push_back((fs::path(discovery_.dev_root) / entry.filename()).string());
    }
    if (ec) {
        throw DiscoveryError(std::string(errors::D3060_NO_SYSFS) + " (" + ec.message() + ")");
    }

    std::sort(out.begin(), out.end());
    return out;
}

std::optional<std::string> ExtronSerialDriver::query_name(const std::string& path) {
    std::unique_ptr<SerialLink> link;
    try {
        link = std::make_unique<SerialLink>(path, serial_);
    } catch (const boost::system::system_error& e) {
        std::cerr << "ExtronSerialDriver: skipping " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    try {
        link->clear();
        link->write("\x1b" "CN\r");
        auto line = link->read_line();
        if (!line) throw DiscoveryError(path + ": " + errors::D3050_NO_REPLY);
        return trim_reply(*line);
    } catch (const boost::system::system_error& e) {
        throw DiscoveryError(path + ": " + e.code().message());
    }
}

std::vector<Device> ExtronSerialDriver::discover() {
    std::vector<Device> out;
    for (const auto& path : candidate_ports()) {
        auto lock = port_lock(path);
        std::lock_guard<std::mutex> lk(*lock);

        auto device_name = query_name(path);
        if (!device_name) continue;
        if (device_name->empty()) {
            std::cerr << "ExtronSerialDriver: " << path << " answered with an empty name, ignored" << std::endl;
            continue;
        }
        if (debug_) std::cerr << "ExtronSerialDriver: found '" << *device_name << "' on " << path << std::endl;
        out.push_back(Device{ *device_name, path });
    }
    return out;
}

void ExtronSerialDriver::switch_input(const std::string& path, const std::string& input) {
    auto lock = port_lock(path);
    std::lock_guard<std::mutex> lk(*lock);

    std::string reply;
    try {
        SerialLink link(path, serial_);
        link.clear();
        link.write(input + "!");
        auto line = link.read_line();
        if (!line) throw DeviceCommunicationError(path + ": " + errors::D3050_NO_REPLY);
        reply = trim_reply(*line);
    } catch (const boost::system::system_error& e) {
        throw DeviceCommunicationError(path + ": " + e.code().message());
    }

    if (debug_) std::cerr << "ExtronSerialDriver: " << path << " <- " << input << "! -> " << reply << std::endl;

    switch (classify_select_reply(reply, input)) {
        case Reply::Ok:
            return;
        case Reply::InvalidInput:
            throw InvalidInputError(input + " rejected by " + path + " (" + reply + ")");
        case Reply::Unexpected:
            break;
    }
    throw DeviceCommunicationError(path + ": unexpected answer " + reply);
}

ExtronSerialDriver::Reply ExtronSerialDriver::classify_select_reply(const std::string& line, const std::string& input) {
    std::string compact;
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
    }

    // E01: input number out of range, E13: value out of range
    if (compact.rfind("E01", 0) == 0 || compact.rfind("E13", 0) == 0) return Reply::InvalidInput;

    // "In<n>All", spaces removed
    if (compact.rfind("In", 0) != 0) return Reply::Unexpected;
    auto all = compact.find("All", 2);
    if (all == std::string::npos) return Reply::Unexpected;
    std::string answered = compact.substr(2, all - 2);

    if (all_digits(answered) && all_digits(input)) {
        return strip_leading_zeros(answered) == strip_leading_zeros(input) ? Reply::Ok : Reply::Unexpected;
    }
    return answered == input ? Reply::Ok : Reply::Unexpected;
}

std::string ExtronSerialDriver::trim_reply(const std::string& line) {
    std::string out = line;
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) out.pop_back();
    return out;
}

} // namespace extronctl
