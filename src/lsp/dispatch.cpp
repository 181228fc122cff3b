#include "langbridge/lsp/dispatch.hpp"

#include "langbridge/format.hpp"

using namespace langbridge::literals;

namespace langbridge::lsp {

    dispatcher::dispatcher(reply_sink reply)
            : reply_{std::move(reply)}, worker_{[this](std::stop_token stop) { run(std::move(stop)); }} {}

    dispatcher::~dispatcher() {
        worker_.request_stop();
        queue_cv_.notify_all();
    }

    void dispatcher::on_notification(std::string method, notification_handler handler) {
        std::lock_guard lock{registry_mutex_};
        notification_handlers_[std::move(method)].push_back(std::move(handler));
    }

    void dispatcher::on_request(std::string method, request_handler handler) {
        std::lock_guard lock{registry_mutex_};
        request_handlers_[std::move(method)] = std::move(handler);
    }

    std::size_t dispatcher::subscriber_count(const std::string& method) const {
        std::lock_guard lock{registry_mutex_};
        auto it = notification_handlers_.find(method);
        return it == notification_handlers_.end() ? 0 : it->second.size();
    }

    void dispatcher::post(notification n) {
        {
            std::lock_guard lock{queue_mutex_};
            queue_.emplace_back(std::move(n));
        }
        queue_cv_.notify_one();
    }

    void dispatcher::post(request r) {
        {
            std::lock_guard lock{queue_mutex_};
            queue_.emplace_back(std::move(r));
        }
        queue_cv_.notify_one();
    }

    void dispatcher::drain() {
        std::unique_lock lock{queue_mutex_};
        idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
    }

    void dispatcher::run(std::stop_token stop) {
        for (;;) {
            item next{};
            {
                std::unique_lock lock{queue_mutex_};
                busy_ = false;
                if (queue_.empty()) {
                    idle_cv_.notify_all();
                }
                if (!queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                    return;
                }
                next = std::move(queue_.front());
                queue_.pop_front();
                busy_ = true;
            }
            std::visit([this](const auto& m) { deliver(m); }, next);
        }
    }

    void dispatcher::deliver(const notification& n) {
        std::vector<notification_handler> handlers{};
        {
            std::lock_guard lock{registry_mutex_};
            if (auto it = notification_handlers_.find(n.method); it != notification_handlers_.end()) {
                handlers = it->second;
            }
        }

        if (handlers.empty()) {
            debug_log("no subscriber for notification '", n.method, "'");
            return;
        }

        for (const auto& handler : handlers) {
            try {
                handler(n);
            } catch (const std::exception& e) {
                error_log("notification handler for '", n.method, "' failed: ", e.what());
            }
        }
    }

    void dispatcher::deliver(const request& r) {
        request_handler handler{};
        {
            std::lock_guard lock{registry_mutex_};
            if (auto it = request_handlers_.find(r.method); it != request_handlers_.end()) {
                handler = it->second;
            }
        }

        response reply{.id = r.id};
        if (!handler) {
            debug_log("unsupported server request '", r.method, "'");
            reply.error = response_error{
                    .code = error_code::method_not_found, .message = "Method not supported: {}"_format(r.method)};
        }
        else {
            try {
                reply.result = handler(r);
            } catch (const remote_error& e) {
                reply.error = e.error();
            } catch (const std::exception& e) {
                error_log("request handler for '", r.method, "' failed: ", e.what());
                reply.error = response_error{.code = error_code::internal_error, .message = e.what()};
            }
        }

        try {
            reply_(reply);
        } catch (const std::exception& e) {
            warn_log("could not answer server request '", r.method, "': ", e.what());
        }
    }

}  // namespace langbridge::lsp
