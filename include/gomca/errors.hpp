#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gomca {

    using namespace std::string_view_literals;

    enum class syntax_error_kind : uint8_t {
        missing_colon,
        invalid_number,
        missing_offset_prefix,
        invalid_hex,
        missing_comment_marker,
    };

    inline constexpr std::string_view to_string(syntax_error_kind kind) {
        switch (kind) {
            case syntax_error_kind::missing_colon:
                return "missing_colon"sv;
            case syntax_error_kind::invalid_number:
                return "invalid_number"sv;
            case syntax_error_kind::missing_offset_prefix:
                return "missing_offset_prefix"sv;
            case syntax_error_kind::invalid_hex:
                return "invalid_hex"sv;
            case syntax_error_kind::missing_comment_marker:
                return "missing_comment_marker"sv;
        }
        return "invalid_number"sv;
    }

    // A disassembly line that does not match the objdump instruction grammar.
    class syntax_error : public std::runtime_error {
      public:
        syntax_error(syntax_error_kind kind, std::string reason, std::string line);

        syntax_error_kind kind() const noexcept { return kind_; }
        const std::string& reason() const noexcept { return reason_; }
        const std::string& line() const noexcept { return line_; }

      private:
        syntax_error_kind kind_;
        std::string reason_;
        std::string line_;
    };

    class io_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class process_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class config_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

}  // namespace gomca
