#pragma once

#include "langbridge.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace langbridge::test::detail {
    namespace fs = std::filesystem;
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p};
        return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    // argv of the scripted server built next to the tests
    inline std::vector<std::string> fake_server_command(std::vector<std::string> extra = {}) {
        std::vector<std::string> argv{LANGBRIDGE_FAKE_SERVER_PATH};
        argv.insert(argv.end(), extra.begin(), extra.end());
        return argv;
    }

    inline lsp::bridge_options fake_options(std::vector<std::string> extra = {}) {
        lsp::bridge_options opts{};
        opts.command = fake_server_command(std::move(extra));
        opts.request_timeout = 5s;
        opts.startup_timeout = 5s;
        opts.shutdown_grace = 1s;
        return opts;
    }

    inline glz::generic parse_json(std::string_view text) {
        glz::generic value{};
        auto ec = glz::read_json(value, text);
        INFO("json: " << text);
        REQUIRE(!ec);
        return value;
    }

    inline bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return predicate();
    }

    inline bool process_alive(pid_t pid) {
        return ::kill(pid, 0) == 0;
    }

    // collects notifications of one method from the dispatcher thread
    struct notification_log {
        std::mutex mutex{};
        std::vector<lsp::notification> items{};

        void push(const lsp::notification& n) {
            std::lock_guard lock{mutex};
            items.push_back(n);
        }

        std::size_t size() {
            std::lock_guard lock{mutex};
            return items.size();
        }

        std::vector<lsp::notification> snapshot() {
            std::lock_guard lock{mutex};
            return items;
        }
    };

}  // namespace langbridge::test::detail
