#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <streambuf>
#include <string>

namespace extronctl {

struct LogOptions {
    // Directory for extronctl.log; empty means no log file.
    std::string directory;
    bool syslog = false;
    // Keep writing to the terminal as well.
    bool console = true;
    std::string ident = "extronctl";
};

/**
 * @brief Routes everything written to std::cout and std::cerr to the
 * configured sinks for as long as it is alive.
 *
 * Components keep logging with plain `std::cerr << "Component: ..."`; whole
 * lines are copied to the log file (appended) and/or syslog. The previous
 * stream buffers are restored on destruction. Install it before any threads
 * that log are started.
 */
class LogRedirect {
public:
    explicit LogRedirect(const LogOptions& options);
    ~LogRedirect();

    LogRedirect(const LogRedirect&) = delete;
    LogRedirect& operator=(const LogRedirect&) = delete;

    // Full path of the log file, or empty.
    const std::string& file_path() const { return file_path_; }

private:
    class LineBuffer;

    void emit(const std::string& line, int priority, std::streambuf* console);

    LogOptions options_;
    std::string file_path_;
    std::ofstream file_;
    std::mutex m_;

    std::unique_ptr<LineBuffer> out_buf_;
    std::unique_ptr<LineBuffer> err_buf_;
    std::streambuf* old_out_ = nullptr;
    std::streambuf* old_err_ = nullptr;
};

} // namespace extronctl
