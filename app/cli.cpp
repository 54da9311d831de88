#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace gomca::literals;

namespace gomca::cli {

    namespace detail {

        using namespace std::string_view_literals;

        struct render_flags {
            bool file{false};
            bool offset{false};
            bool instr{false};
            bool goasm{false};
            CLI::Option* file_opt{nullptr};
            CLI::Option* offset_opt{nullptr};
            CLI::Option* instr_opt{nullptr};
            CLI::Option* goasm_opt{nullptr};
        };

        static void add_render_flags(CLI::App& sub, render_flags& flags) {
            flags.file_opt = sub.add_flag("--file,!--no-file", flags.file, "Include file name and line in output");
            flags.offset_opt = sub.add_flag("--offset,!--no-offset", flags.offset, "Include offset in output");
            flags.instr_opt =
                    sub.add_flag("--instr,!--no-instr", flags.instr, "Include encoded instructions in output");
            flags.goasm_opt = sub.add_flag("--goasm,!--no-goasm", flags.goasm, "Include Go assembly in output");
        }

        static void apply_render_flags(const render_flags& flags, render_config& render) {
            if (flags.file_opt->count() > 0U) {
                render.show_file = flags.file;
            }
            if (flags.offset_opt->count() > 0U) {
                render.show_offset = flags.offset;
            }
            if (flags.instr_opt->count() > 0U) {
                render.show_instruction_bytes = flags.instr;
            }
            if (flags.goasm_opt->count() > 0U) {
                render.show_high_level_asm = flags.goasm;
            }
        }

        static constexpr std::string_view bool_text(bool value) { return value ? "true"sv : "false"sv; }

        static void print_config(const startup_config& cfg, std::ostream& os) {
            if (cfg.output == output_mode::json) {
                os << render_config_json(cfg) << '\n';
                return;
            }
            os << "command=" << to_string(cfg.command) << '\n';
            os << "file=" << bool_text(cfg.render.show_file) << '\n';
            os << "offset=" << bool_text(cfg.render.show_offset) << '\n';
            os << "instr=" << bool_text(cfg.render.show_instruction_bytes) << '\n';
            os << "goasm=" << bool_text(cfg.render.show_high_level_asm) << '\n';
            os << "go=" << cfg.tools.go_path.string() << '\n';
            os << "mca=" << cfg.tools.mca_path.string() << '\n';
            if (cfg.command == command_kind::run) {
                os << "symbol=" << cfg.symbol_regex << '\n';
                os << "binary=" << cfg.binary.string() << '\n';
                os << "mca_args=" << utils::join_with_separator(cfg.mca_args, " "sv) << '\n';
            }
            if (cfg.command == command_kind::fix) {
                os << "input=" << cfg.input_path.string() << '\n';
                os << "out=" << (cfg.output_path ? cfg.output_path->string() : "<stdout>") << '\n';
            }
            os << "config=" << (cfg.config_file ? cfg.config_file->string() : "<none>") << '\n';
        }

        static void report_summary(const startup_config& cfg, const transform_summary& summary) {
            if (!cfg.verbose) {
                return;
            }
            std::cerr << "gomca: {} label(s), {} instruction(s){}\n"_format(
                    summary.labels, summary.instructions, summary.truncated ? ", stopped at return" : "");
        }

        static int run_fix(const startup_config& cfg) {
            std::ifstream in{cfg.input_path};
            if (!in) {
                throw io_error{"failed to open {}"_format(cfg.input_path.string())};
            }

            stream_transform transform{transform_config{.render = cfg.render}};

            if (!cfg.output_path) {
                report_summary(cfg, transform.run(in, std::cout));
                return 0;
            }

            std::ofstream out{*cfg.output_path, std::ios::out | std::ios::trunc};
            if (!out) {
                throw io_error{"failed to create {}"_format(cfg.output_path->string())};
            }
            auto summary = transform.run(in, out);
            out.close();
            if (!out) {
                throw io_error{"failed to close {}"_format(cfg.output_path->string())};
            }
            report_summary(cfg, summary);
            return 0;
        }

        static int run_analysis(const startup_config& cfg) {
            auto producer = objdump_command(cfg.tools, cfg.symbol_regex, cfg.binary);
            auto consumer = mca_command(cfg.tools, cfg.mca_args);
            if (cfg.verbose) {
                std::cerr << "+ {}\n+ {}\n"_format(producer, consumer);
            }

            stream_transform transform{transform_config{.render = cfg.render}};
            report_summary(cfg, run_pipeline(producer, consumer, transform));
            return 0;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"gomca: feed `go tool objdump` disassembly to llvm-mca"};
        app.require_subcommand(0, 1);

        bool show_version = false;
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string config_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON file with defaults (file, offset, instr, goasm, go, mca)");
        app.add_option("--output", output_arg, "--print-config format: table|json");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--verbose", cfg.verbose, "Echo external commands and transform statistics");

        std::string input_arg{};
        std::string out_arg{};
        detail::render_flags fix_flags{};
        auto* fix = app.add_subcommand("fix", "Rewrite `go tool objdump -gnu` output into llvm-mca input");
        fix->add_option("input", input_arg, "objdump output to rewrite")->required();
        fix->add_option("--out", out_arg, "Output file path (default: stdout)");
        detail::add_render_flags(*fix, fix_flags);

        std::string binary_arg{};
        std::string go_arg{};
        std::string mca_arg{};
        detail::render_flags run_flags{};
        auto* run = app.add_subcommand("run", "Disassemble a Go binary and analyze it with llvm-mca");
        run->add_option("-s,--symbol", cfg.symbol_regex, "Only dump symbols matching this regexp")->required();
        run->add_option("binary", binary_arg, "Go binary to disassemble")->required();
        run->add_option("mca_args", cfg.mca_args, "Arguments passed to llvm-mca (after --)");
        run->add_option("--go", go_arg, "go executable path");
        run->add_option("--mca", mca_arg, "llvm-mca executable path");
        detail::add_render_flags(*run, run_flags);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }

        if (show_version) {
            std::cout << "gomca 0.1.0\n";
            return std::optional<int>{0};
        }

        if (fix->parsed()) {
            cfg.command = command_kind::fix;
            cfg.render = render_config::fix_defaults();
        }
        else if (run->parsed()) {
            cfg.command = command_kind::run;
            cfg.render = render_config{};
        }

        cfg.tools = default_tool_config();
        if (!config_arg.empty()) {
            cfg.config_file = config_arg;
            apply_file_config(load_config_file(*cfg.config_file), cfg.render, cfg.tools);
        }

        if (cfg.command == command_kind::fix) {
            detail::apply_render_flags(fix_flags, cfg.render);
            cfg.input_path = input_arg;
            if (!out_arg.empty()) {
                cfg.output_path = out_arg;
            }
        }
        if (cfg.command == command_kind::run) {
            detail::apply_render_flags(run_flags, cfg.render);
            cfg.binary = binary_arg;
            if (!go_arg.empty()) {
                cfg.tools.go_path = go_arg;
            }
            if (!mca_arg.empty()) {
                cfg.tools.mca_path = mca_arg;
            }
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.command == command_kind::none) {
            std::cerr << app.help();
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

    int run_command(const startup_config& cfg) {
        switch (cfg.command) {
            case command_kind::fix:
                return detail::run_fix(cfg);
            case command_kind::run:
                return detail::run_analysis(cfg);
            case command_kind::none:
                break;
        }
        return 2;
    }

}  // namespace gomca::cli
