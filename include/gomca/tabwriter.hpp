#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace gomca {

    struct tab_writer_options {
        size_t min_width{18U};
        size_t tab_width{8U};
        size_t padding{1U};
    };

    /*
     * Elastic tabstop writer. Text is split into cells terminated by '\t'; cells of the
     * same column in consecutive lines form a block padded (with tabs) to a common width.
     * The last cell of a line never takes part in alignment.
     *
     * Lines are held back until a line with a single cell completes, since only such a
     * line ends every open column block. Call flush() after the last write.
     */
    class tab_writer {
      public:
        explicit tab_writer(std::ostream& out, tab_writer_options options = {});

        tab_writer(const tab_writer&) = delete;
        tab_writer& operator=(const tab_writer&) = delete;

        void write(std::string_view text);
        void flush();

        tab_writer& operator<<(std::string_view text) {
            write(text);
            return *this;
        }

      private:
        struct cell {
            std::string text{};
            size_t width{};
        };
        using line = std::vector<cell>;

        size_t terminate_cell();
        void flush_lines();
        void format(size_t line0, size_t line1);
        void write_lines(size_t line0, size_t line1);
        void write_padding(size_t text_width, size_t cell_width);
        void emit(std::string_view text);

        std::ostream& out_;
        tab_writer_options options_;
        std::vector<line> lines_{line{}};
        std::string pending_{};
        std::vector<size_t> widths_{};
    };

}  // namespace gomca
