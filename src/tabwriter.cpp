#include "gomca/tabwriter.hpp"

#include "gomca/errors.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace gomca {

    namespace detail {
        // column width in code points; continuation bytes of a UTF-8 sequence do not count
        static size_t text_width(std::string_view text) noexcept {
            return static_cast<size_t>(std::ranges::count_if(
                    text, [](char c) { return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U; }));
        }
    }  // namespace detail

    tab_writer::tab_writer(std::ostream& out, tab_writer_options options) : out_{out}, options_{options} {}

    void tab_writer::write(std::string_view text) {
        for (auto c : text) {
            if (c != '\t' && c != '\n') {
                pending_.push_back(c);
                continue;
            }

            auto ncells = terminate_cell();
            if (c == '\n') {
                lines_.emplace_back();
                // a single-cell line closes every column block above it
                if (ncells == 1U) {
                    flush_lines();
                }
            }
        }
    }

    void tab_writer::flush() {
        if (!pending_.empty()) {
            terminate_cell();
        }
        flush_lines();
        out_.flush();
        if (!out_) {
            throw io_error{"failed to flush output"};
        }
    }

    size_t tab_writer::terminate_cell() {
        auto& current = lines_.back();
        auto width = detail::text_width(pending_);
        current.push_back(cell{.text = std::move(pending_), .width = width});
        pending_.clear();
        return current.size();
    }

    void tab_writer::flush_lines() {
        format(0U, lines_.size());
        lines_.assign(1U, line{});
        widths_.clear();
    }

    void tab_writer::format(size_t line0, size_t line1) {
        auto column = widths_.size();
        for (auto current = line0; current < line1; ++current) {
            if (column + 1U >= lines_[current].size()) {
                continue;
            }

            // this line opens a block for `column`: emit everything above it first
            write_lines(line0, current);
            line0 = current;

            auto width = options_.min_width;
            for (; current < line1; ++current) {
                const auto& cells = lines_[current];
                if (column + 1U >= cells.size()) {
                    break;
                }
                width = std::max(width, cells[column].width + options_.padding);
            }

            widths_.push_back(width);
            format(line0, current);
            widths_.pop_back();
            line0 = current;
        }

        write_lines(line0, line1);
    }

    void tab_writer::write_lines(size_t line0, size_t line1) {
        for (auto i = line0; i < line1; ++i) {
            const auto& cells = lines_[i];
            for (size_t j = 0U; j < cells.size(); ++j) {
                const auto& c = cells[j];
                if (!c.text.empty()) {
                    emit(c.text);
                }
                if (j < widths_.size()) {
                    write_padding(c.width, widths_[j]);
                }
            }

            // the last buffered line is still open and has no newline yet
            if (i + 1U != lines_.size()) {
                emit("\n");
            }
        }
    }

    void tab_writer::write_padding(size_t text_width, size_t cell_width) {
        auto tab = options_.tab_width;
        if (tab == 0U) {
            return;
        }
        cell_width = (cell_width + tab - 1U) / tab * tab;
        auto n = cell_width - text_width;
        auto tabs = (n + tab - 1U) / tab;
        for (size_t i = 0U; i < tabs; ++i) {
            emit("\t");
        }
    }

    void tab_writer::emit(std::string_view text) {
        out_.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!out_) {
            throw io_error{"failed to write output"};
        }
    }

}  // namespace gomca
