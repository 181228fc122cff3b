#include "langbridge/lsp/pending.hpp"

#include "langbridge/format.hpp"

#include <vector>

using namespace langbridge::literals;

namespace langbridge::lsp {

    pending_table::pending_table() : timer_{[this](std::stop_token stop) { run_timer(std::move(stop)); }} {}

    pending_table::~pending_table() {
        timer_.request_stop();
        cv_.notify_all();
        if (timer_.joinable()) {
            timer_.join();
        }
        fail_all("bridge destroyed");
    }

    pending_table::registration pending_table::add(std::string method, std::chrono::milliseconds timeout) {
        registration reg{};
        {
            std::lock_guard lock{mutex_};
            reg.id = next_id_++;
            auto deadline = clock::now() + timeout;
            auto& e = entries_[reg.id];
            e.method = std::move(method);
            e.deadline = deadline;
            reg.result = e.promise.get_future();
            deadlines_.emplace(deadline, reg.id);
        }
        cv_.notify_all();
        return reg;
    }

    std::optional<pending_table::entry> pending_table::take(std::int64_t id) {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        auto [first, last] = deadlines_.equal_range(it->second.deadline);
        for (auto d = first; d != last; ++d) {
            if (d->second == id) {
                deadlines_.erase(d);
                break;
            }
        }
        entry e = std::move(it->second);
        entries_.erase(it);
        return e;
    }

    bool pending_table::complete(const response& resp) {
        auto* id = std::get_if<std::int64_t>(&resp.id);
        if (id == nullptr) {
            return false;
        }

        std::optional<entry> e{};
        {
            std::lock_guard lock{mutex_};
            e = take(*id);
        }
        if (!e) {
            return false;
        }

        if (resp.error) {
            e->promise.set_exception(std::make_exception_ptr(remote_error{*resp.error}));
        }
        else {
            e->promise.set_value(resp.result);
        }
        return true;
    }

    bool pending_table::reject(std::int64_t id, std::exception_ptr error) {
        std::optional<entry> e{};
        {
            std::lock_guard lock{mutex_};
            e = take(id);
        }
        if (!e) {
            return false;
        }
        e->promise.set_exception(std::move(error));
        return true;
    }

    std::size_t pending_table::fail_all(const std::string& reason) {
        std::unordered_map<std::int64_t, entry> failed{};
        {
            std::lock_guard lock{mutex_};
            failed.swap(entries_);
            deadlines_.clear();
        }
        for (auto& [id, e] : failed) {
            e.promise.set_exception(std::make_exception_ptr(
                    process_terminated_error{"request {} ({}) failed: {}"_format(id, e.method, reason)}));
        }
        return failed.size();
    }

    bool pending_table::contains(std::int64_t id) const {
        std::lock_guard lock{mutex_};
        return entries_.contains(id);
    }

    std::size_t pending_table::size() const {
        std::lock_guard lock{mutex_};
        return entries_.size();
    }

    std::int64_t pending_table::last_id() const {
        std::lock_guard lock{mutex_};
        return next_id_ - 1;
    }

    void pending_table::run_timer(std::stop_token stop) {
        std::unique_lock lock{mutex_};
        while (!stop.stop_requested()) {
            if (deadlines_.empty()) {
                cv_.wait(lock, stop, [this] { return !deadlines_.empty(); });
                continue;
            }

            auto earliest = deadlines_.begin()->first;
            if (clock::now() < earliest) {
                cv_.wait_until(lock, stop, earliest, [this, earliest] {
                    return deadlines_.empty() || deadlines_.begin()->first < earliest;
                });
                continue;
            }

            std::vector<entry> expired{};
            auto now = clock::now();
            while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
                auto id = deadlines_.begin()->second;
                deadlines_.erase(deadlines_.begin());
                if (auto it = entries_.find(id); it != entries_.end()) {
                    expired.push_back(std::move(it->second));
                    entries_.erase(it);
                }
            }

            // settled outside the lock
            lock.unlock();
            for (auto& e : expired) {
                debug_log("request '", e.method, "' timed out");
                e.promise.set_exception(std::make_exception_ptr(timeout_error{"request '{}' timed out"_format(e.method)}));
            }
            lock.lock();
        }
    }

}  // namespace langbridge::lsp
