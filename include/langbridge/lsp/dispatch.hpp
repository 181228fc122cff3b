#pragma once

#include "protocol.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace langbridge::lsp {

    using notification_handler = std::function<void(const notification&)>;

    // returns the raw JSON result; throwing remote_error answers with that error object
    using request_handler = std::function<std::string(const request&)>;

    // sends the reply to a server-initiated request
    using reply_sink = std::function<void(const response&)>;

    /*
     * Subscriber registries plus one worker thread that delivers notifications and server requests in
     * arrival order. Posting never blocks on a handler, so the read loop keeps draining the server while
     * slow handlers run.
     */
    class dispatcher {
      public:
        explicit dispatcher(reply_sink reply);
        ~dispatcher();

        dispatcher(const dispatcher&) = delete;
        dispatcher& operator=(const dispatcher&) = delete;

        // handlers for one method run in registration order
        void on_notification(std::string method, notification_handler handler);

        // replaces any earlier handler for `method`
        void on_request(std::string method, request_handler handler);

        void post(notification n);
        void post(request r);

        // Blocks until everything posted so far has been handled.
        void drain();

        std::size_t subscriber_count(const std::string& method) const;

      private:
        using item = std::variant<notification, request>;

        reply_sink reply_;

        mutable std::mutex registry_mutex_{};
        std::map<std::string, std::vector<notification_handler>, std::less<>> notification_handlers_{};
        std::map<std::string, request_handler, std::less<>> request_handlers_{};

        std::mutex queue_mutex_{};
        std::condition_variable_any queue_cv_{};
        std::condition_variable idle_cv_{};
        std::deque<item> queue_{};
        bool busy_{false};
        std::jthread worker_{};

        void run(std::stop_token stop);
        void deliver(const notification& n);
        void deliver(const request& r);
    };

}  // namespace langbridge::lsp
