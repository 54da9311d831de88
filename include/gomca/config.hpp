#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gomca {

    using namespace std::string_view_literals;

    /*
     * gomca Startup Config Options
     *
     * Rendering (annotations appended to each instruction as trailing comments)
     * - show_file: "file:line" the instruction was generated from.
     * - show_offset: byte offset of the instruction as reported by objdump.
     * - show_instruction_bytes: raw instruction encoding as hex pairs.
     * - show_high_level_asm: Go assembler form of the instruction.
     *
     * Tools
     * - go_path: go executable used for "go tool objdump".
     * - mca_path: llvm-mca executable path.
     *
     * Run inputs
     * - symbol_regex: objdump -s filter; only the first matching symbol is analyzed.
     * - binary: Go binary handed to objdump.
     * - mca_args: arguments passed through unchanged to llvm-mca.
     *
     * Fix inputs
     * - input_path: objdump text to transform.
     * - output_path: destination file (stdout when unset).
     *
     * UX
     * - config_file: optional JSON file supplying defaults for the above.
     * - output_mode: shape of --print-config ("table" or "json").
     * - verbose: echo external commands and transform statistics to stderr.
     */

    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    struct render_config {
        bool show_file{false};
        bool show_offset{false};
        bool show_instruction_bytes{false};
        bool show_high_level_asm{false};

        constexpr bool any() const noexcept {
            return show_file || show_offset || show_instruction_bytes || show_high_level_asm;
        }

        // defaults of the `fix` subcommand
        static constexpr render_config fix_defaults() noexcept {
            return render_config{.show_file = true, .show_high_level_asm = true};
        }

        constexpr bool operator==(const render_config&) const = default;
    };

    struct transform_config {
        render_config render{};
        std::string stop_mnemonic{"ret"};
    };

    struct tool_config {
        std::filesystem::path go_path{"go"};
        std::filesystem::path mca_path{"llvm-mca"};
    };

    enum class command_kind { none, fix, run };

    inline constexpr std::string_view to_string(command_kind kind) {
        switch (kind) {
            case command_kind::none:
                return "none"sv;
            case command_kind::fix:
                return "fix"sv;
            case command_kind::run:
                return "run"sv;
        }
        return "none"sv;
    }

    struct startup_config {
        command_kind command{command_kind::none};
        render_config render{};
        tool_config tools{};

        std::string symbol_regex{};
        std::filesystem::path binary{};
        std::vector<std::string> mca_args{};

        std::filesystem::path input_path{};
        std::optional<std::filesystem::path> output_path{};

        std::optional<std::filesystem::path> config_file{};
        output_mode output{output_mode::table};
        bool verbose{false};
        bool print_config{false};
    };

    // Values read from a JSON config file; unset keys keep the built-in defaults.
    struct file_config {
        std::optional<bool> file{};
        std::optional<bool> offset{};
        std::optional<bool> instr{};
        std::optional<bool> goasm{};
        std::optional<std::string> go{};
        std::optional<std::string> mca{};
    };

    // built-in tool locations, preferring the paths discovered at configure time
    tool_config default_tool_config();

    file_config load_config_file(const std::filesystem::path& path);
    file_config parse_config_text(std::string_view json, std::string_view origin);

    void apply_file_config(const file_config& file, render_config& render, tool_config& tools);

    std::string render_config_json(const startup_config& cfg);

}  // namespace gomca
