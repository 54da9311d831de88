#include "utils.hpp"

namespace gomca::test { namespace detail {
    static std::string tabulate(std::string_view text, tab_writer_options options = {}) {
        std::ostringstream out{};
        tab_writer writer{out, options};
        writer.write(text);
        writer.flush();
        return out.str();
    }
}}  // namespace gomca::test::detail

namespace gomca::test {
    using namespace std::string_view_literals;

    TEST_CASE("004: cells pad to the minimum width", "[004][tabwriter]") {
        CHECK(detail::tabulate("a\tb\nccc\td\n"sv) == "a\t\t\tb\nccc\t\t\td\n");
        CHECK(detail::tabulate("\t// stopping at ret\n"sv) == "\t\t\t// stopping at ret\n");
    }

    TEST_CASE("004: wide cell widens the whole column", "[004][tabwriter]") {
        CHECK(detail::tabulate("abcdefghijklmnopqrstuvwxyz\tx\nab\ty\n"sv)
              == "abcdefghijklmnopqrstuvwxyz\tx\nab\t\t\t\ty\n");
    }

    TEST_CASE("004: nested columns", "[004][tabwriter]") {
        CHECK(detail::tabulate("a\tb\tc\ndd\tee\tf\n"sv) == "a\t\t\tb\t\t\tc\ndd\t\t\tee\t\t\tf\n");
    }

    TEST_CASE("004: single cell line ends the column block", "[004][tabwriter]") {
        std::ostringstream out{};
        tab_writer writer{out};

        writer << "ab\tx\n"sv;
        CHECK(out.str().empty());

        writer << "LABEL:\n"sv;
        CHECK(out.str() == "ab\t\t\tx\nLABEL:\n");

        writer << "abcdefghijklmnopqrstuvwxyz\ty\n"sv;
        writer.flush();
        CHECK(out.str() == "ab\t\t\tx\nLABEL:\nabcdefghijklmnopqrstuvwxyz\ty\n");
    }

    TEST_CASE("004: unterminated text is written on flush", "[004][tabwriter]") {
        CHECK(detail::tabulate("abc"sv) == "abc");
        CHECK(detail::tabulate(""sv).empty());

        std::ostringstream out{};
        tab_writer writer{out};
        writer.write("ab");
        writer.write("c\td\n");
        writer.flush();
        CHECK(out.str() == "abc\t\t\td\n");
    }

    TEST_CASE("004: width counts code points", "[004][tabwriter]") {
        CHECK(detail::tabulate("\xc3\xa9\tx\nab\ty\n"sv) == "\xc3\xa9\t\t\tx\nab\t\t\ty\n");
    }

    TEST_CASE("004: custom options", "[004][tabwriter]") {
        tab_writer_options options{.min_width = 0U, .tab_width = 4U, .padding = 1U};
        CHECK(detail::tabulate("a\tb\nabcd\tc\n"sv, options) == "a\t\tb\nabcd\tc\n");
    }

    TEST_CASE("004: failed writes raise io_error", "[004][tabwriter][error]") {
        std::ostringstream out{};
        out.setstate(std::ios::badbit);
        tab_writer writer{out};

        CHECK_THROWS_AS(writer.write("a\n"sv), io_error);
        CHECK_THROWS_AS(writer.flush(), io_error);
    }
}  // namespace gomca::test
