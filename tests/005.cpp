#include "utils.hpp"

namespace gomca::test { namespace detail {
    struct failing_streambuf : std::streambuf {
      protected:
        int_type underflow() override { throw std::runtime_error{"read failed"}; }
    };

    inline constexpr auto truncated_listing =
            "TEXT main.add(SB) /tmp/add.go\n"
            "  add.go:3\t\t0x0\t\t\t8b000020\t\tADD R0, R1, R0\t\t// add x0, x1, x0\n"
            "  add.go:4\t\t0x4\t\t\td65f03c0\t\tRET\t\t\t// ret\n"
            "TEXT main.sub(SB) /tmp/add.go\n"
            "garbage\n"sv;
}}  // namespace gomca::test::detail

namespace gomca::test {
    using namespace std::string_view_literals;

    TEST_CASE("005: fully annotated instruction", "[005][transform]") {
        transform_config config{};
        config.render = render_config{
                .show_file = true, .show_offset = true, .show_instruction_bytes = true, .show_high_level_asm = true};

        auto out = detail::transform_text("foo.s:10\t0x20\tf94007e0\tMOVD 8(RSP), R0\t// ldr x0, [sp,#8]\n"sv, config);
        CHECK(out == "  ldr x0, [sp,#8]\t// foo.s:10\t\t0x20\t\t\tf94007e0\t\tMOVD 8(RSP), R0\n");
    }

    TEST_CASE("005: stops at the first return", "[005][transform]") {
        std::istringstream in{std::string{detail::truncated_listing}};
        std::ostringstream out{};

        auto summary = stream_transform{transform_config{}}.run(in, out);

        CHECK(out.str() == "main_add_SB___tmp_add_go:\n  add x0, x1, x0\n\t\t\t// stopping at ret\n");
        CHECK(summary.labels == 1U);
        CHECK(summary.instructions == 1U);
        CHECK(summary.truncated);
    }

    TEST_CASE("005: annotations align across a function body", "[005][transform]") {
        transform_config config{};
        config.render = render_config::fix_defaults();
        config.render.show_high_level_asm = false;

        auto input =
                "a.s:1\t0x0\t910003fd\tMOVD RSP, R29\t// mov x29, sp\n"
                "a.s:2\t0x4\tf9400be0\tMOVD 16(RSP), R0\t// ldr x0, [sp,#16]\n"
                "a.s:3\t0x8\td65f03c0\tRET\t// ret\n"sv;

        CHECK(detail::transform_text(input, config)
              == "  mov x29, sp\t\t// a.s:1\n  ldr x0, [sp,#16]\t// a.s:2\n\t\t\t// stopping at ret\n");
    }

    TEST_CASE("005: empty annotations still open the comment", "[005][transform]") {
        transform_config config{};
        config.render.show_offset = true;
        config.render.show_instruction_bytes = true;

        CHECK(detail::transform_text("x.s:1 0x0 // nop\n"sv, config) == "  nop\t\t\t// 0x0\t\t\t\n");
    }

    TEST_CASE("005: input without a return", "[005][transform]") {
        std::istringstream empty{};
        std::ostringstream out{};
        stream_transform transform{transform_config{}};

        auto summary = transform.run(empty, out);
        CHECK(out.str().empty());
        CHECK(summary.labels == 0U);
        CHECK(summary.instructions == 0U);
        CHECK_FALSE(summary.truncated);

        auto text = detail::transform_text("TEXT f(SB)\nx.s:1\t0x0\td503201f\tNOP\t// nop\n"sv);
        CHECK(text == "f_SB_:\n  nop\n");
    }

    TEST_CASE("005: carriage returns are stripped", "[005][transform]") {
        auto text = detail::transform_text("TEXT f(SB)\r\nx.s:1\t0x0\td503201f\tNOP\t// nop\r\n"sv);
        CHECK(text == "f_SB_:\n  nop\n");
    }

    TEST_CASE("005: custom stop mnemonic", "[005][transform]") {
        transform_config config{};
        config.stop_mnemonic = "nop";

        auto text = detail::transform_text("x.s:1\t0x0\td503201f\tNOP\t// nop\nx.s:2\t0x4\td65f03c0\tRET\t// ret\n"sv, config);
        CHECK(text == "\t\t\t// stopping at nop\n");
    }

    TEST_CASE("005: malformed line aborts after earlier output", "[005][transform][error]") {
        std::istringstream in{"TEXT f(SB)\nbad line\nx.s:1\t0x0\td503201f\tNOP\t// nop\n"};
        std::ostringstream out{};
        stream_transform transform{transform_config{}};

        try {
            (void)transform.run(in, out);
            FAIL("expected syntax error");
        } catch (const syntax_error& e) {
            CHECK(e.kind() == syntax_error_kind::missing_colon);
            CHECK(e.line() == "bad line");
        }
        CHECK(out.str() == "f_SB_:\n");
    }

    TEST_CASE("005: same input gives the same output", "[005][transform]") {
        transform_config config{};
        config.render = render_config::fix_defaults();
        stream_transform transform{config};

        std::istringstream first_in{std::string{detail::truncated_listing}};
        std::istringstream second_in{std::string{detail::truncated_listing}};
        std::ostringstream first{};
        std::ostringstream second{};
        (void)transform.run(first_in, first);
        (void)transform.run(second_in, second);

        CHECK(first.str() == second.str());
        CHECK(transform.config().render == render_config::fix_defaults());
    }

    TEST_CASE("005: stream failures raise io_error", "[005][transform][error]") {
        stream_transform transform{transform_config{}};

        detail::failing_streambuf failing{};
        std::istream broken_in{&failing};
        std::ostringstream out{};
        CHECK_THROWS_AS(transform.run(broken_in, out), io_error);

        std::istringstream in{"TEXT f(SB)\n"};
        std::ostringstream broken_out{};
        broken_out.setstate(std::ios::badbit);
        CHECK_THROWS_AS(transform.run(in, broken_out), io_error);
    }
}  // namespace gomca::test
