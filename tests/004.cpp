#include "utils.hpp"

namespace langbridge::test {
    using namespace std::chrono_literals;

    TEST_CASE("004: ids start at one and never repeat", "[004][pending]") {
        lsp::pending_table table{};
        CHECK(table.last_id() == 0);

        auto a = table.add("a", 5s);
        auto b = table.add("b", 5s);
        auto c = table.add("c", 5s);
        CHECK(a.id == 1);
        CHECK(b.id == 2);
        CHECK(c.id == 3);
        CHECK(table.size() == 3U);

        CHECK(table.fail_all("reset") == 3U);
        auto d = table.add("d", 5s);
        CHECK(d.id == 4);
        CHECK(table.last_id() == 4);
    }

    TEST_CASE("004: responses resolve their own entry in any order", "[004][pending]") {
        lsp::pending_table table{};
        auto first = table.add("first", 5s);
        auto second = table.add("second", 5s);

        REQUIRE(table.complete(lsp::response{.id = second.id, .result = R"("B")"}));
        REQUIRE(table.complete(lsp::response{.id = first.id, .result = R"("A")"}));

        CHECK(first.result.get() == R"("A")");
        CHECK(second.result.get() == R"("B")");
        CHECK(table.size() == 0U);
    }

    TEST_CASE("004: error responses become remote_error", "[004][pending]") {
        lsp::pending_table table{};
        auto reg = table.add("textDocument/hover", 5s);

        REQUIRE(table.complete(
                lsp::response{
                        .id = reg.id,
                        .error = lsp::response_error{.code = lsp::error_code::content_modified, .message = "modified"}}));

        try {
            (void)reg.result.get();
            FAIL("expected remote_error");
        } catch (const lsp::remote_error& e) {
            CHECK(e.code() == lsp::error_code::content_modified);
            CHECK(e.message() == "modified");
            CHECK_FALSE(e.data());
        }
    }

    TEST_CASE("004: unknown, late and string ids are discarded", "[004][pending]") {
        lsp::pending_table table{};
        auto reg = table.add("m", 5s);

        CHECK_FALSE(table.complete(lsp::response{.id = std::int64_t{99}}));
        CHECK_FALSE(table.complete(lsp::response{.id = std::string{"1"}}));
        CHECK(table.contains(reg.id));

        REQUIRE(table.complete(lsp::response{.id = reg.id, .result = "1"}));
        CHECK_FALSE(table.complete(lsp::response{.id = reg.id, .result = "2"}));
        CHECK(reg.result.get() == "1");
    }

    TEST_CASE("004: timeouts fire within a bounded margin and remove the entry", "[004][pending][timeout]") {
        lsp::pending_table table{};
        auto started = std::chrono::steady_clock::now();
        auto reg = table.add("slow", 100ms);
        auto other = table.add("patient", 10s);

        CHECK_THROWS_AS(reg.result.get(), lsp::timeout_error);
        auto elapsed = std::chrono::steady_clock::now() - started;
        CHECK(elapsed >= 100ms);
        CHECK(elapsed < 1s);

        CHECK_FALSE(table.contains(reg.id));
        CHECK(table.contains(other.id));
        CHECK_FALSE(table.complete(lsp::response{.id = reg.id, .result = "late"}));
    }

    TEST_CASE("004: earlier deadlines added later still fire first", "[004][pending][timeout]") {
        lsp::pending_table table{};
        auto long_wait = table.add("long", 5s);
        auto short_wait = table.add("short", 50ms);

        CHECK(short_wait.result.wait_for(2s) == std::future_status::ready);
        CHECK_THROWS_AS(short_wait.result.get(), lsp::timeout_error);
        CHECK(long_wait.result.wait_for(0ms) == std::future_status::timeout);
    }

    TEST_CASE("004: fail_all resolves every entry exactly once", "[004][pending]") {
        lsp::pending_table table{};
        std::vector<lsp::pending_table::registration> regs{};
        for (int i = 0; i < 5; ++i) {
            regs.push_back(table.add("m" + std::to_string(i), 5s));
        }

        CHECK(table.fail_all("language server exited") == 5U);
        for (auto& reg : regs) {
            CHECK_THROWS_AS(reg.result.get(), lsp::process_terminated_error);
        }
        CHECK(table.size() == 0U);
        CHECK(table.fail_all("again") == 0U);
    }

    TEST_CASE("004: reject settles one entry with the given exception", "[004][pending]") {
        lsp::pending_table table{};
        auto reg = table.add("m", 5s);
        auto keep = table.add("n", 5s);

        REQUIRE(table.reject(reg.id, std::make_exception_ptr(lsp::process_terminated_error{"write failed"})));
        CHECK_FALSE(table.reject(reg.id, std::make_exception_ptr(lsp::process_terminated_error{"twice"})));
        CHECK_THROWS_AS(reg.result.get(), lsp::process_terminated_error);
        CHECK(table.contains(keep.id));
    }

    TEST_CASE("004: concurrent registrations get distinct ids", "[004][pending][threads]") {
        lsp::pending_table table{};
        std::vector<std::int64_t> ids(400);
        std::vector<std::jthread> workers{};
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&table, &ids, t] {
                for (int i = 0; i < 100; ++i) {
                    ids[static_cast<size_t>(t * 100 + i)] = table.add("m", 5s).id;
                }
            });
        }
        workers.clear();

        std::ranges::sort(ids);
        CHECK(std::ranges::adjacent_find(ids) == ids.end());
        CHECK(ids.front() == 1);
        CHECK(ids.back() == 400);
    }

}  // namespace langbridge::test
