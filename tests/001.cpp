#include "utils.hpp"

namespace gomca::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: output mode parsing", "[001][config]") {
        output_mode mode = output_mode::table;

        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        REQUIRE(try_parse_output_mode("table"sv, mode));
        CHECK(mode == output_mode::table);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));
        CHECK(mode == output_mode::table);

        CHECK(to_string(output_mode::table) == "table"sv);
        CHECK(to_string(output_mode::json) == "json"sv);
        CHECK(to_string(command_kind::fix) == "fix"sv);
        CHECK(to_string(command_kind::run) == "run"sv);
    }

    TEST_CASE("001: render defaults", "[001][config]") {
        render_config plain{};
        CHECK_FALSE(plain.any());

        auto fix = render_config::fix_defaults();
        CHECK(fix.show_file);
        CHECK_FALSE(fix.show_offset);
        CHECK_FALSE(fix.show_instruction_bytes);
        CHECK(fix.show_high_level_asm);
        CHECK(fix.any());

        transform_config transform{};
        CHECK(transform.stop_mnemonic == "ret");
        CHECK(transform.render == plain);
    }

    TEST_CASE("001: config file values override defaults", "[001][config][json]") {
        auto parsed = parse_config_text(R"({"offset":true,"goasm":false,"mca":"/opt/llvm/bin/llvm-mca"})"sv, "inline"sv);
        CHECK_FALSE(parsed.file.has_value());
        REQUIRE(parsed.offset.has_value());
        CHECK(*parsed.offset);
        REQUIRE(parsed.goasm.has_value());
        CHECK_FALSE(*parsed.goasm);
        CHECK_FALSE(parsed.go.has_value());

        auto render = render_config::fix_defaults();
        tool_config tools{};
        apply_file_config(parsed, render, tools);

        CHECK(render.show_file);
        CHECK(render.show_offset);
        CHECK_FALSE(render.show_instruction_bytes);
        CHECK_FALSE(render.show_high_level_asm);
        CHECK(tools.go_path.string() == "go");
        CHECK(tools.mca_path.string() == "/opt/llvm/bin/llvm-mca");
    }

    TEST_CASE("001: malformed config file is a config error", "[001][config][json]") {
        detail::temp_dir temp{"gomca_config_bad"};
        auto path = temp.path / "gomca.json";
        detail::write_text_file(path, R"({"file": "yes"})");

        try {
            (void)load_config_file(path);
            FAIL("expected config error");
        } catch (const config_error& e) {
            auto message = std::string{e.what()};
            CHECK(message.find("failed to parse config file") != std::string::npos);
            CHECK(message.find(path.string()) != std::string::npos);
        }

        CHECK_THROWS_AS(load_config_file(temp.path / "missing.json"), config_error);
    }

    TEST_CASE("001: config file is read from disk", "[001][config][json]") {
        detail::temp_dir temp{"gomca_config_ok"};
        auto path = temp.path / "gomca.json";
        detail::write_text_file(path, R"({"file": false, "instr": true, "go": "/usr/local/go/bin/go"})");

        auto parsed = load_config_file(path);
        REQUIRE(parsed.file.has_value());
        CHECK_FALSE(*parsed.file);
        REQUIRE(parsed.instr.has_value());
        CHECK(*parsed.instr);
        REQUIRE(parsed.go.has_value());
        CHECK(*parsed.go == "/usr/local/go/bin/go");
    }

    TEST_CASE("001: resolved config renders as json", "[001][config][json]") {
        startup_config cfg{};
        cfg.command = command_kind::run;
        cfg.render.show_offset = true;
        cfg.symbol_regex = "main.add";
        cfg.binary = "/tmp/prog";
        cfg.mca_args = {"-mcpu=neoverse-n1"};

        auto json = render_config_json(cfg);
        CHECK(json.find(R"("command":"run")") != std::string::npos);
        CHECK(json.find(R"("offset":true)") != std::string::npos);
        CHECK(json.find(R"("symbol":"main.add")") != std::string::npos);
        CHECK(json.find(R"("mca_args":["-mcpu=neoverse-n1"])") != std::string::npos);
        CHECK(json.find(R"("input")") == std::string::npos);
    }
}  // namespace gomca::test
