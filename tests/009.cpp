#include "utils.hpp"

namespace langbridge::test {
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    namespace detail {
        static std::vector<glz::generic> numbered_objects(int count) {
            std::vector<glz::generic> items{};
            for (int i = 0; i < count; ++i) {
                items.push_back(parse_json(R"({"n":)" + std::to_string(i) + "}"));
            }
            return items;
        }

        static std::vector<std::string> strings_at(const glz::generic& page, std::initializer_list<std::string_view> path) {
            std::vector<std::string> out{};
            const auto* items = json::find(page, "items"sv);
            REQUIRE(items);
            REQUIRE(items->is_array());
            for (const auto& item : items->get_array()) {
                out.push_back(json::string_or(json::find_path(item, path)));
            }
            return out;
        }

        // fake server, workspace and toolbox over a project holding main.py
        struct tool_fixture {
            temp_dir temp{"langbridge_tools"};
            lsp::bridge_client bridge{fake_options()};
            std::unique_ptr<workspace> ws{};
            std::unique_ptr<tools::toolbox> box{};

            ~tool_fixture() { bridge.shutdown(); }

            tool_fixture() {
                write_file(temp.path / "main.py", "import os\nprint(undefined_name)\n");
                ws = std::make_unique<workspace>(bridge, temp.path);
                ws->start();
                box = std::make_unique<tools::toolbox>(bridge, *ws, 3);
            }

            std::string uri() const { return ws->document_uri("main.py"); }

            tools::tool_output run(std::string_view name, std::string_view arguments) {
                return box->invoke(name, arguments);
            }

            glz::generic run_json(std::string_view name, std::string_view arguments) {
                auto out = run(name, arguments);
                INFO(name << ": " << out.text);
                REQUIRE_FALSE(out.is_error);
                return parse_json(out.text);
            }
        };
    }  // namespace detail

    TEST_CASE("009: paginate slices and annotates items", "[009][pagination]") {
        auto page = detail::parse_json(paginate(detail::numbered_objects(5), page_request{.offset = 1, .limit = 2}));
        CHECK(json::number_or(json::find(page, "totalItems"sv)) == 5.0);
        CHECK(json::number_or(json::find(page, "offset"sv)) == 1.0);
        CHECK(json::number_or(json::find(page, "limit"sv)) == 2.0);
        CHECK(json::find(page, "hasMore"sv)->get<bool>());
        CHECK(json::number_or(json::find(page, "nextOffset"sv)) == 3.0);

        const auto& items = json::find(page, "items"sv)->get_array();
        REQUIRE(items.size() == 2U);
        CHECK(json::number_or(json::find(items[0], "n"sv)) == 1.0);
        CHECK(json::number_or(json::find(items[0], "offset"sv)) == 1.0);
        CHECK(json::number_or(json::find(items[1], "offset"sv)) == 2.0);
    }

    TEST_CASE("009: the last page has no next offset", "[009][pagination]") {
        auto last = detail::parse_json(paginate(detail::numbered_objects(5), page_request{.offset = 3, .limit = 10}));
        CHECK(json::find(last, "items"sv)->get_array().size() == 2U);
        CHECK_FALSE(json::find(last, "hasMore"sv)->get<bool>());
        REQUIRE(json::find(last, "nextOffset"sv));
        CHECK(json::find(last, "nextOffset"sv)->is_null());

        auto past = detail::parse_json(paginate(detail::numbered_objects(2), page_request{.offset = 9, .limit = 3}));
        CHECK(json::find(past, "items"sv)->get_array().empty());
        CHECK(json::number_or(json::find(past, "totalItems"sv)) == 2.0);
        CHECK_FALSE(json::find(past, "hasMore"sv)->get<bool>());

        auto empty = detail::parse_json(paginate({}, page_request{}));
        CHECK(json::number_or(json::find(empty, "limit"sv)) == static_cast<double>(default_page_size));
        CHECK(json::find(empty, "items"sv)->get_array().empty());
    }

    TEST_CASE("009: paginate leaves non-object items alone", "[009][pagination]") {
        std::vector<glz::generic> items{detail::parse_json("1"), detail::parse_json(R"("two")")};
        auto page = detail::parse_json(paginate(std::move(items), page_request{.offset = 0, .limit = 5}));
        const auto& out = json::find(page, "items"sv)->get_array();
        REQUIRE(out.size() == 2U);
        CHECK(out[0].is_number());
        CHECK(out[1].is_string());
    }

    TEST_CASE("009: paginate rejects bad bounds", "[009][pagination]") {
        CHECK_THROWS_AS(paginate({}, page_request{.offset = -1, .limit = 5}), std::invalid_argument);
        CHECK_THROWS_AS(paginate({}, page_request{.offset = 0, .limit = 0}), std::invalid_argument);
        CHECK_THROWS_AS(paginate({}, page_request{.offset = 0, .limit = -3}), std::invalid_argument);
    }

    TEST_CASE("009: catalog lists every tool once with a schema", "[009][tools]") {
        auto tools = tools::catalog();
        CHECK(tools.size() == 19U);

        std::vector<std::string_view> names{};
        for (const auto& tool : tools) {
            names.push_back(tool.name);
            CHECK_FALSE(tool.description.empty());
            auto schema = detail::parse_json(tool.input_schema);
            CHECK(json::string_or(json::find(schema, "type"sv)) == "object");
        }
        std::ranges::sort(names);
        CHECK(std::ranges::adjacent_find(names) == names.end());
        CHECK(std::ranges::binary_search(names, "hover"sv));
        CHECK(std::ranges::binary_search(names, "restart_server"sv));
    }

    TEST_CASE("009: hover returns the server answer or a placeholder", "[009][tools][navigation]") {
        detail::tool_fixture f{};

        auto hover = f.run_json("hover", R"({"file_path":"main.py","line":1,"character":4})");
        CHECK(json::string_or(json::find_path(hover, {"contents"sv, "value"sv})) == "fake hover at 1:4");
        CHECK(f.ws->is_open(f.uri()));

        auto nothing = f.run_json("hover", R"({"file_path":"main.py","line":99,"character":0})");
        CHECK(json::string_or(json::find(nothing, "contents"sv)) == "No hover information available");
    }

    TEST_CASE("009: definition passes the location list through", "[009][tools][navigation]") {
        detail::tool_fixture f{};
        auto result = f.run_json("definition", R"({"file_path":"main.py","line":1,"character":6})");
        REQUIRE(result.is_array());
        REQUIRE(result.get_array().size() == 1U);
        CHECK(json::string_or(json::find(result.get_array().front(), "uri"sv)) == f.uri());
    }

    TEST_CASE("009: completions are sorted by sortText then label and paginated", "[009][tools][completion]") {
        detail::tool_fixture f{};

        auto first = f.run_json("completion", R"({"file_path":"main.py","line":0,"character":0})");
        CHECK(detail::strings_at(first, {"label"sv}) == std::vector<std::string>{"zz_first", "alpha", "beta"});
        CHECK(json::number_or(json::find(first, "totalItems"sv)) == 4.0);
        CHECK(json::number_or(json::find(first, "limit"sv)) == 3.0);
        CHECK(json::number_or(json::find(first, "nextOffset"sv)) == 3.0);

        auto second = f.run_json("completion", R"({"file_path":"main.py","line":0,"character":0,"offset":3,"limit":3})");
        CHECK(detail::strings_at(second, {"label"sv}) == std::vector<std::string>{"gamma"});
        CHECK_FALSE(json::find(second, "hasMore"sv)->get<bool>());
    }

    TEST_CASE("009: references are sorted by uri then position", "[009][tools][navigation]") {
        detail::tool_fixture f{};
        auto page = f.run_json("references", R"({"file_path":"main.py","line":0,"character":7,"limit":10})");

        CHECK(detail::strings_at(page, {"uri"sv}) ==
              std::vector<std::string>{f.uri(), f.uri(), "file:///zzz/other.py"});
        const auto& items = json::find(page, "items"sv)->get_array();
        CHECK(json::number_or(json::find_path(items[0], {"range"sv, "start"sv, "line"sv})) == 2.0);
        CHECK(json::number_or(json::find_path(items[1], {"range"sv, "start"sv, "line"sv})) == 10.0);
    }

    TEST_CASE("009: document symbols are flattened in source order", "[009][tools][symbols]") {
        detail::tool_fixture f{};
        auto page = f.run_json("document_symbols", R"({"file_path":"main.py","limit":10})");

        CHECK(detail::strings_at(page, {"name"sv}) == std::vector<std::string>{"Foo", "bar", "baz", "main"});
        CHECK(detail::strings_at(page, {"containerName"sv}) == std::vector<std::string>{"", "Foo", "Foo", ""});
    }

    TEST_CASE("009: workspace symbols are sorted by name then location", "[009][tools][symbols]") {
        detail::tool_fixture f{};
        auto page = f.run_json("workspace_symbols", R"({"query":"a","limit":10})");

        CHECK(detail::strings_at(page, {"name"sv}) == std::vector<std::string>{"alpha", "alpha", "zeta"});
        CHECK(detail::strings_at(page, {"location"sv, "uri"sv}) ==
              std::vector<std::string>{"file:///a.py", "file:///b.py", "file:///a.py"});
    }

    TEST_CASE("009: diagnostics come from published notifications", "[009][tools][diagnostics]") {
        detail::tool_fixture f{};
        auto uri = f.ws->ensure_open("main.py");
        REQUIRE(detail::wait_until([&] { return f.ws->diagnostics_for(uri).has_value(); }));

        auto page = f.run_json("diagnostics", R"({"file_path":"main.py"})");
        const auto& items = json::find(page, "items"sv)->get_array();
        REQUIRE(items.size() == 2U);
        CHECK(json::number_or(json::find(items[0], "severity"sv)) == 1.0);
        CHECK(json::number_or(json::find(items[1], "severity"sv)) == 2.0);
        CHECK(json::string_or(json::find(items[0], "uri"sv)) == uri);

        auto all = f.run_json("diagnostics", "{}");
        CHECK(json::number_or(json::find(all, "totalItems"sv)) == 2.0);
    }

    TEST_CASE("009: code actions, rename and imports", "[009][tools][edits]") {
        detail::tool_fixture f{};

        SECTION("code actions") {
            auto actions = f.run_json(
                    "code_actions",
                    R"({"file_path":"main.py","start_line":0,"start_char":0,"end_line":0,"end_char":9})");
            REQUIRE(actions.is_array());
            CHECK(actions.get_array().size() == 2U);
        }

        SECTION("rename") {
            auto edit = f.run_json(
                    "rename", R"({"file_path":"main.py","line":1,"character":6,"new_name":"defined_name"})");
            const auto* changes = json::find_path(edit, {"changes"sv, f.uri()});
            REQUIRE(changes);
            REQUIRE(changes->is_array());
            CHECK(json::string_or(json::find(changes->get_array().front(), "newText"sv)) == "defined_name");
        }

        SECTION("rename at an unrenamable position") {
            auto out = f.run("rename", R"({"file_path":"main.py","line":99,"character":0,"new_name":"x"})");
            CHECK(out.is_error);
            CHECK(out.text == "Cannot rename at this position");
        }

        SECTION("add import") {
            auto edit = f.run_json("add_import", R"({"file_path":"main.py","line":0,"character":7})");
            const auto* changes = json::find_path(edit, {"changes"sv, f.uri()});
            REQUIRE(changes);
            CHECK(json::string_or(json::find(changes->get_array().front(), "newText"sv)) == "import os\n");
        }

        SECTION("organize imports through a pushed edit") {
            auto edits = f.run_json("organize_imports", R"({"file_path":"main.py"})");
            REQUIRE(edits.is_array());
            REQUIRE(edits.get_array().size() == 1U);
            CHECK(json::string_or(json::find(edits.get_array().front(), "newText"sv)) == "import os\nimport sys\n");
            CHECK_FALSE(f.ws->take_applied_edit());
        }
    }

    TEST_CASE("009: server errors become error outputs", "[009][tools][errors]") {
        detail::tool_fixture f{};

        auto unsupported = f.run("format_document", R"({"file_path":"main.py","tab_size":2})");
        CHECK(unsupported.is_error);
        CHECK(unsupported.text.starts_with("LSP error: "));
        CHECK(unsupported.text.find("(code: -32601)") != std::string::npos);

        auto missing = f.run("hover", R"({"file_path":"missing.py","line":0,"character":0})");
        CHECK(missing.is_error);
        CHECK(missing.text.find("missing.py") != std::string::npos);

        f.bridge.shutdown();
        auto down = f.run("definition", R"({"file_path":"main.py","line":0,"character":0})");
        CHECK(down.is_error);
        CHECK(down.text.starts_with("Language server error: "));
    }

    TEST_CASE("009: malformed arguments throw tool_error", "[009][tools][errors]") {
        detail::tool_fixture f{};

        CHECK_THROWS_AS(f.run("no_such_tool", "{}"), tools::tool_error);
        CHECK_THROWS_AS(f.run("hover", R"({"line":0,"character":0})"), tools::tool_error);
        CHECK_THROWS_AS(f.run("hover", R"({"file_path":"main.py","line":-1,"character":0})"), tools::tool_error);
        CHECK_THROWS_AS(f.run("hover", R"({"file_path":"main.py","line":"one","character":0})"), tools::tool_error);
        CHECK_THROWS_AS(f.run("hover", "not json"), tools::tool_error);
        CHECK_THROWS_AS(
                f.run("completion", R"({"file_path":"main.py","line":0,"character":0,"limit":0})"), tools::tool_error);
        CHECK_THROWS_AS(
                f.run("references", R"({"file_path":"main.py","line":0,"character":0,"offset":-2})"), tools::tool_error);
        CHECK_THROWS_AS(f.run("rename", R"({"file_path":"main.py","line":0,"character":0,"new_name":""})"), tools::tool_error);
        CHECK_THROWS_AS(f.run("format_document", R"({"file_path":"main.py","tab_size":0})"), tools::tool_error);

        try {
            (void)f.run("no_such_tool", "{}");
        } catch (const tools::tool_error& e) {
            CHECK(std::string_view{e.what()} == "Unknown tool: no_such_tool");
        }
    }

    TEST_CASE("009: project tools", "[009][tools][project]") {
        detail::tool_fixture f{};

        auto created = f.run("create_config", "{}");
        CHECK_FALSE(created.is_error);
        CHECK(created.text == "Created pyrightconfig.json");
        CHECK(std::filesystem::exists(f.temp.path / "pyrightconfig.json"));
        CHECK(f.ws->config().loaded);

        auto again = f.run("create_config", "");
        CHECK(again.text == "pyrightconfig.json already exists");

        auto restarted = f.run("restart_server", "{}");
        CHECK_FALSE(restarted.is_error);
        CHECK(restarted.text == "language server restarted successfully");
        CHECK(f.bridge.restart_count() == 1);
        CHECK(f.bridge.state() == lsp::bridge_state::ready);

        auto hover = f.run_json("hover", R"({"file_path":"main.py","line":0,"character":1})");
        CHECK(json::string_or(json::find_path(hover, {"contents"sv, "value"sv})) == "fake hover at 0:1");
    }

}  // namespace langbridge::test
