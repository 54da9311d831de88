#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gomca::objdump {

    using namespace std::string_view_literals;

    // Prefix of the per-symbol header emitted by `go tool objdump`.
    inline constexpr auto header_prefix = "TEXT "sv;

    // Separates the Go assembly from the GNU rendering in `-gnu` output.
    inline constexpr auto comment_marker = "// "sv;

    /*
     * One instruction line of `go tool objdump -gnu` output:
     *
     *   blake2b_arm64.s:334	0xfbf40			f94007e0		MOVD 8(RSP), R0      // ldr x0, [sp,#8]
     *
     * `gnu_asm` is the form llvm-mca consumes; everything else is provenance.
     */
    struct instruction_record {
        std::string file{};
        uint64_t line{};
        uintptr_t offset{};
        std::vector<uint8_t> encoding{};
        std::string go_asm{};
        std::string gnu_asm{};
    };

    // Parses one instruction line; throws syntax_error carrying the untouched input.
    instruction_record parse_line(std::string_view text);

    bool is_header(std::string_view text) noexcept;

    // Turns a symbol descriptor into an llvm-mca label, e.g. "pkg.Func(int)" -> "pkg_Func_int_:".
    std::string mangle_label(std::string_view symbol);

    std::string hex_encode(const std::vector<uint8_t>& bytes);

}  // namespace gomca::objdump
