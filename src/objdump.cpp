#include "gomca/objdump.hpp"

#include "gomca/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace gomca::objdump {

    namespace detail {

        [[noreturn]] static void fail(syntax_error_kind kind, std::string_view reason, std::string_view line) {
            throw syntax_error{kind, std::string{reason}, std::string{line}};
        }

        static constexpr uint8_t hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') {
                return static_cast<uint8_t>(c - '0');
            }
            return static_cast<uint8_t>(utils::char_tolower(c) - 'a' + 10);
        }

        static std::vector<uint8_t> decode_hex(std::string_view digits, std::string_view line) {
            if (digits.size() % 2U != 0U) {
                fail(syntax_error_kind::invalid_hex, "odd length instruction encoding"sv, line);
            }
            std::vector<uint8_t> bytes{};
            bytes.reserve(digits.size() / 2U);
            for (size_t i = 0U; i < digits.size(); i += 2U) {
                if (!utils::is_hex_digit(digits[i]) || !utils::is_hex_digit(digits[i + 1U])) {
                    fail(syntax_error_kind::invalid_hex, "invalid byte in instruction encoding"sv, line);
                }
                bytes.push_back(static_cast<uint8_t>((hex_value(digits[i]) << 4U) | hex_value(digits[i + 1U])));
            }
            return bytes;
        }

        static constexpr char replace_label_char(char c) noexcept {
            switch (c) {
                case '(':
                case ')':
                case '*':
                case '[':
                case ']':
                case '/':
                case ' ':
                case '.':
                    return '_';
                default:
                    return c;
            }
        }

    }  // namespace detail

    instruction_record parse_line(std::string_view text) {
        auto rest = utils::trim_view(text);

        auto colon = rest.find(':');
        if (colon == std::string_view::npos) {
            detail::fail(syntax_error_kind::missing_colon, "missing colon in file name"sv, text);
        }
        instruction_record record{};
        record.file = std::string{rest.substr(0U, colon)};
        rest.remove_prefix(colon + 1U);

        auto digits = utils::leading_run(rest, utils::is_digit);
        auto line_number = utils::parse_arithmetic<uint64_t>(rest.substr(0U, digits));
        if (!line_number) {
            detail::fail(syntax_error_kind::invalid_number, "invalid line number"sv, text);
        }
        record.line = *line_number;
        rest = utils::trim_view(rest.substr(digits));

        if (!rest.starts_with("0x"sv)) {
            detail::fail(syntax_error_kind::missing_offset_prefix, "missing 0x prefix for offset"sv, text);
        }
        rest.remove_prefix(2U);

        digits = utils::leading_run(rest, utils::is_hex_digit);
        auto offset = utils::parse_arithmetic<uintptr_t>(rest.substr(0U, digits), 16);
        if (!offset) {
            detail::fail(syntax_error_kind::invalid_number, "invalid offset"sv, text);
        }
        record.offset = *offset;
        rest = utils::trim_view(rest.substr(digits));

        // the encoding may be absent; an empty run decodes to zero bytes
        digits = utils::leading_run(rest, utils::is_hex_digit);
        record.encoding = detail::decode_hex(rest.substr(0U, digits), text);
        rest = utils::trim_view(rest.substr(digits));

        auto marker = rest.find(comment_marker);
        if (marker == std::string_view::npos) {
            detail::fail(syntax_error_kind::missing_comment_marker, "missing GNU assembly comment"sv, text);
        }
        record.go_asm = std::string{utils::trim_view(rest.substr(0U, marker))};
        record.gnu_asm = std::string{utils::trim_view(rest.substr(marker + comment_marker.size()))};

        return record;
    }

    bool is_header(std::string_view text) noexcept {
        return text.starts_with(header_prefix);
    }

    std::string mangle_label(std::string_view symbol) {
        std::string label{};
        label.reserve(symbol.size() + 1U);
        std::ranges::transform(symbol, std::back_inserter(label), detail::replace_label_char);
        label.push_back(':');
        return label;
    }

    std::string hex_encode(const std::vector<uint8_t>& bytes) {
        static constexpr auto digits = "0123456789abcdef"sv;
        std::string out{};
        out.reserve(bytes.size() * 2U);
        for (auto byte : bytes) {
            out.push_back(digits[byte >> 4U]);
            out.push_back(digits[byte & 0x0FU]);
        }
        return out;
    }

}  // namespace gomca::objdump
