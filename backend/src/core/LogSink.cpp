/*
src/core/LogSink.cpp
Line-buffered tee of std::cout/std::cerr into a log file and syslog.
*/
#include "core/LogSink.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <syslog.h>

namespace extronctl {

class LogRedirect::LineBuffer : public std::streambuf {
public:
    LineBuffer(LogRedirect& owner, std::streambuf* console, int priority)
    : owner_(owner), console_(console), priority_(priority) {}

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
        const char c = traits_type::to_char_type(ch);
        append(&c, 1);
        return ch;
    }

    // A single insertion of whole lines is never split by another thread.
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        append(s, n);
        return n;
    }

    int sync() override {
        std::lock_guard<std::mutex> lk(owner_.m_);
        if (owner_.options_.console && console_) console_->pubsync();
        if (owner_.file_.is_open()) owner_.file_.flush();
        return 0;
    }

private:
    void append(const char* s, std::streamsize n) {
        std::vector<std::string> complete;
        {
            std::lock_guard<std::mutex> lk(line_m_);
            for (std::streamsize i = 0; i < n; ++i) {
                if (s[i] != '\n') {
                    line_.push_back(s[i]);
                    continue;
                }
                complete.push_back(std::move(line_));
                line_.clear();
            }
        }
        for (const auto& line : complete) owner_.emit(line, priority_, console_);
    }

    LogRedirect& owner_;
    std::streambuf* console_;
    int priority_;
    std::mutex line_m_;
    std::string line_;
};

LogRedirect::LogRedirect(const LogOptions& options)
: options_(options) {
    if (!options_.directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(options_.directory, ec);
        if (ec) throw std::runtime_error("log: cannot create '" + options_.directory + "': " + ec.message());
        file_path_ = (std::filesystem::path(options_.directory) / (options_.ident + ".log")).string();
        file_.open(file_path_, std::ios::out | std::ios::app);
        if (!file_) throw std::runtime_error("log: cannot open '" + file_path_ + "'");
    }
    if (options_.syslog) ::openlog(options_.ident.c_str(), LOG_PID, LOG_USER);

    old_out_ = std::cout.rdbuf();
    old_err_ = std::cerr.rdbuf();
    out_buf_ = std::make_unique<LineBuffer>(*this, old_out_, LOG_INFO);
    err_buf_ = std::make_unique<LineBuffer>(*this, old_err_, LOG_NOTICE);
    std::cout.rdbuf(out_buf_.get());
    std::cerr.rdbuf(err_buf_.get());
}

LogRedirect::~LogRedirect() {
    std::cout.flush();
    std::cerr.flush();
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
    if (options_.syslog) ::closelog();
}

void LogRedirect::emit(const std::string& line, int priority, std::streambuf* console) {
    std::lock_guard<std::mutex> lk(m_);
    if (options_.console && console) {
        console->sputn(line.data(), static_cast<std::streamsize>(line.size()));
        console->sputc('\n');
    }
    if (file_.is_open()) file_ << line << '\n';
    if (options_.syslog) ::syslog(priority, "%s", line.c_str());
}

} // namespace extronctl
