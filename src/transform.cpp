#include "gomca/transform.hpp"

#include "gomca/errors.hpp"
#include "gomca/format.hpp"
#include "gomca/tabwriter.hpp"
#include "gomca/utils.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

using namespace gomca::literals;

namespace gomca {

    namespace detail {

        // Appends annotation segments; the first one opens the comment.
        class annotation_builder {
          public:
            explicit annotation_builder(std::string& out) : out_{out} {}

            void add(std::string_view segment) {
                out_.push_back('\t');
                if (!opened_) {
                    out_.append(objdump::comment_marker);
                    opened_ = true;
                }
                out_.append(segment);
            }

          private:
            std::string& out_;
            bool opened_{false};
        };

        static std::string_view strip_cr(std::string_view line) {
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1U);
            }
            return line;
        }

    }  // namespace detail

    stream_transform::stream_transform(transform_config config) : config_{std::move(config)} {}

    std::string stream_transform::render_instruction(const objdump::instruction_record& record) const {
        const auto& render = config_.render;

        std::string out{"  "};
        out.append(record.gnu_asm);

        detail::annotation_builder annotations{out};
        if (render.show_file) {
            annotations.add("{}:{}"_format(record.file, record.line));
        }
        if (render.show_offset) {
            annotations.add("{:#x}"_format(record.offset));
        }
        if (render.show_instruction_bytes) {
            annotations.add(objdump::hex_encode(record.encoding));
        }
        if (render.show_high_level_asm) {
            annotations.add(record.go_asm);
        }

        out.push_back('\n');
        return out;
    }

    transform_summary stream_transform::run(std::istream& in, std::ostream& out) const {
        transform_summary summary{};
        tab_writer writer{out};

        std::string raw{};
        while (std::getline(in, raw)) {
            auto text = detail::strip_cr(raw);

            if (objdump::is_header(text)) {
                text.remove_prefix(objdump::header_prefix.size());
                writer << objdump::mangle_label(text) << "\n";
                ++summary.labels;
                continue;
            }

            auto record = objdump::parse_line(text);
            if (record.gnu_asm == config_.stop_mnemonic) {
                writer << "\t// stopping at {}\n"_format(record.gnu_asm);
                summary.truncated = true;
                break;
            }

            writer << render_instruction(record);
            ++summary.instructions;
        }

        if (in.bad()) {
            throw io_error{"failed to read input"};
        }

        writer.flush();
        debug_log("transformed ", summary.instructions, " instructions under ", summary.labels, " labels");
        return summary;
    }

}  // namespace gomca
