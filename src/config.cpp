#include "gomca/config.hpp"

#include "gomca/errors.hpp"
#include "gomca/format.hpp"

#include "internal/platform.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace gomca::literals;
namespace fs = std::filesystem;

namespace gomca::detail {

    struct resolved_config_record {
        std::string command{};
        bool file{};
        bool offset{};
        bool instr{};
        bool goasm{};
        std::string go{};
        std::string mca{};
        std::optional<std::string> symbol{};
        std::optional<std::string> binary{};
        std::vector<std::string> mca_args{};
        std::optional<std::string> input{};
        std::optional<std::string> out{};
        std::optional<std::string> config{};
    };

}  // namespace gomca::detail

namespace glz {

    template <>
    struct meta<gomca::file_config> {
        using T = gomca::file_config;
        static constexpr auto value =
                object("file",
                       &T::file,
                       "offset",
                       &T::offset,
                       "instr",
                       &T::instr,
                       "goasm",
                       &T::goasm,
                       "go",
                       &T::go,
                       "mca",
                       &T::mca);
    };

    template <>
    struct meta<gomca::detail::resolved_config_record> {
        using T = gomca::detail::resolved_config_record;
        static constexpr auto value =
                object("command",
                       &T::command,
                       "file",
                       &T::file,
                       "offset",
                       &T::offset,
                       "instr",
                       &T::instr,
                       "goasm",
                       &T::goasm,
                       "go",
                       &T::go,
                       "mca",
                       &T::mca,
                       "symbol",
                       &T::symbol,
                       "binary",
                       &T::binary,
                       "mca_args",
                       &T::mca_args,
                       "input",
                       &T::input,
                       "out",
                       &T::out,
                       "config",
                       &T::config);
    };

}  // namespace glz

namespace gomca {

    namespace detail {
        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw config_error{"failed to open config file {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw config_error{"failed to read config file {}"_format(path.string())};
            }
            return ss.str();
        }

        static std::optional<std::string> non_empty(const fs::path& path) {
            if (path.empty()) {
                return std::nullopt;
            }
            return path.string();
        }
    }  // namespace detail

    tool_config default_tool_config() {
        namespace tool = internal::platform::tool;
        tool_config tools{};
        tools.go_path = tool::go_path.empty() ? tool::go : tool::go_path;
        tools.mca_path = tool::llvm_mca_path.empty() ? tool::llvm_mca : tool::llvm_mca_path;
        return tools;
    }

    file_config parse_config_text(std::string_view json, std::string_view origin) {
        file_config parsed{};
        std::string buffer{json};
        auto ec = glz::read_json(parsed, buffer);
        if (ec) {
            throw config_error{"failed to parse config file {}: {}"_format(origin, glz::format_error(ec, buffer))};
        }
        return parsed;
    }

    file_config load_config_file(const fs::path& path) {
        auto text = detail::read_text_file(path);
        return parse_config_text(text, path.string());
    }

    void apply_file_config(const file_config& file, render_config& render, tool_config& tools) {
        if (file.file) {
            render.show_file = *file.file;
        }
        if (file.offset) {
            render.show_offset = *file.offset;
        }
        if (file.instr) {
            render.show_instruction_bytes = *file.instr;
        }
        if (file.goasm) {
            render.show_high_level_asm = *file.goasm;
        }
        if (file.go) {
            tools.go_path = *file.go;
        }
        if (file.mca) {
            tools.mca_path = *file.mca;
        }
    }

    std::string render_config_json(const startup_config& cfg) {
        detail::resolved_config_record record{};
        record.command = std::string{to_string(cfg.command)};
        record.file = cfg.render.show_file;
        record.offset = cfg.render.show_offset;
        record.instr = cfg.render.show_instruction_bytes;
        record.goasm = cfg.render.show_high_level_asm;
        record.go = cfg.tools.go_path.string();
        record.mca = cfg.tools.mca_path.string();
        if (cfg.command == command_kind::run) {
            record.symbol = cfg.symbol_regex;
            record.binary = detail::non_empty(cfg.binary);
            record.mca_args = cfg.mca_args;
        }
        if (cfg.command == command_kind::fix) {
            record.input = detail::non_empty(cfg.input_path);
            if (cfg.output_path) {
                record.out = cfg.output_path->string();
            }
        }
        if (cfg.config_file) {
            record.config = cfg.config_file->string();
        }

        std::string json{};
        auto ec = glz::write_json(record, json);
        if (ec) {
            throw std::runtime_error("failed to serialize config");
        }
        return json;
    }

}  // namespace gomca
