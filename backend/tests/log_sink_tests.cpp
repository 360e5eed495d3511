#include <gtest/gtest.h>
#include "core/LogSink.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / (name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    return dir;
}

std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream f(p);
    std::vector<std::string> lines;
    for (std::string line; std::getline(f, line);) lines.push_back(line);
    return lines;
}

} // namespace

TEST(LogRedirect, CopiesWholeLinesToFile) {
    auto dir = fresh_dir("extronctl_log_file");
    extronctl::LogOptions options;
    options.directory = dir.string();
    options.console = false;
    {
        extronctl::LogRedirect redirect(options);
        EXPECT_EQ(redirect.file_path(), (dir / "extronctl.log").string());
        std::cout << "WebSocketServer: client connected (count=" << 1 << ")" << std::endl;
        std::cerr << "DeviceRegistry: rescan via fake failed" << std::endl;
    }

    auto lines = read_lines(dir / "extronctl.log");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "WebSocketServer: client connected (count=1)");
    EXPECT_EQ(lines[1], "DeviceRegistry: rescan via fake failed");
    fs::remove_all(dir);
}

TEST(LogRedirect, AppendsAcrossRuns) {
    auto dir = fresh_dir("extronctl_log_append");
    extronctl::LogOptions options;
    options.directory = dir.string();
    options.console = false;
    {
        extronctl::LogRedirect first(options);
        std::cerr << "first run" << std::endl;
    }
    {
        extronctl::LogRedirect second(options);
        std::cerr << "second run" << std::endl;
    }
    auto lines = read_lines(dir / "extronctl.log");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "second run");
    fs::remove_all(dir);
}

TEST(LogRedirect, KeepsConsoleAndRestoresStreams) {
    auto dir = fresh_dir("extronctl_log_console");
    std::ostringstream console;
    auto* saved = std::cerr.rdbuf(console.rdbuf());

    extronctl::LogOptions options;
    options.directory = dir.string();
    {
        extronctl::LogRedirect redirect(options);
        std::cerr << "Server halted" << std::endl;
    }
    std::cerr << "after" << std::endl;
    std::cerr.rdbuf(saved);

    EXPECT_EQ(console.str(), "Server halted\nafter\n");
    EXPECT_EQ(read_lines(dir / "extronctl.log").size(), 1u);
    fs::remove_all(dir);
}

TEST(LogRedirect, ConcurrentWritersProduceIntactLines) {
    auto dir = fresh_dir("extronctl_log_threads");
    extronctl::LogOptions options;
    options.directory = dir.string();
    options.console = false;
    {
        extronctl::LogRedirect redirect(options);
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([t]() {
                for (int i = 0; i < 50; ++i) {
                    std::ostringstream line;
                    line << "writer" << t << " line" << i << "\n";
                    std::cerr << line.str() << std::flush;
                }
            });
        }
        for (auto& w : writers) w.join();
    }
    auto lines = read_lines(dir / "extronctl.log");
    EXPECT_EQ(lines.size(), 200u);
    for (const auto& line : lines) EXPECT_EQ(line.rfind("writer", 0), 0u) << line;
    fs::remove_all(dir);
}

TEST(LogRedirect, UnwritableDirectoryThrows) {
    extronctl::LogOptions options;
    options.directory = "/proc/extronctl-cannot-create";
    EXPECT_THROW(extronctl::LogRedirect redirect(options), std::runtime_error);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
