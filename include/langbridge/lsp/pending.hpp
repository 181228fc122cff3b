#pragma once

#include "protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace langbridge::lsp {

    /*
     * Correlation table for requests the bridge originates. Every entry owns a promise that resolves exactly
     * once: with the result payload, remote_error, timeout_error or process_terminated_error. A dedicated timer
     * thread expires deadlines so a silent server never holds a caller past its timeout.
     *
     * Ids come from a counter that starts at 1 and is never reset for the lifetime of the table.
     */
    class pending_table {
      public:
        using clock = std::chrono::steady_clock;

        struct registration {
            std::int64_t id{};
            std::future<std::string> result{};
        };

        pending_table();
        ~pending_table();

        pending_table(const pending_table&) = delete;
        pending_table& operator=(const pending_table&) = delete;

        registration add(std::string method, std::chrono::milliseconds timeout);

        // Resolves the entry `resp` answers; false when no live entry carries that id.
        bool complete(const response& resp);

        // Resolves one entry with an arbitrary exception (write failures).
        bool reject(std::int64_t id, std::exception_ptr error);

        // Resolves every live entry with process_terminated_error; returns how many were failed.
        std::size_t fail_all(const std::string& reason);

        bool contains(std::int64_t id) const;
        std::size_t size() const;
        std::int64_t last_id() const;

      private:
        struct entry {
            std::string method{};
            clock::time_point deadline{};
            std::promise<std::string> promise{};
        };

        mutable std::mutex mutex_{};
        std::condition_variable_any cv_{};
        std::int64_t next_id_{1};
        std::unordered_map<std::int64_t, entry> entries_{};
        std::multimap<clock::time_point, std::int64_t> deadlines_{};
        std::jthread timer_{};

        std::optional<entry> take(std::int64_t id);
        void run_timer(std::stop_token stop);
    };

}  // namespace langbridge::lsp
