#pragma once

#include "config.hpp"
#include "objdump.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace gomca {

    struct transform_summary {
        size_t labels{};
        size_t instructions{};
        bool truncated{false};
    };

    /*
     * Rewrites `go tool objdump -gnu` text into llvm-mca input.
     *
     * Symbol headers become labels, instruction lines are reduced to their GNU form with
     * the enabled provenance annotations appended as a column-aligned trailing comment.
     * Processing ends for the whole stream at the first `stop_mnemonic` instruction, so
     * only the first function body is ever emitted.
     *
     * The first malformed line aborts the run with syntax_error; read or write failures
     * raise io_error. Output written before the failure is not retracted.
     */
    class stream_transform {
      public:
        explicit stream_transform(transform_config config);

        transform_summary run(std::istream& in, std::ostream& out) const;

        const transform_config& config() const noexcept { return config_; }

      private:
        std::string render_instruction(const objdump::instruction_record& record) const;

        const transform_config config_;
    };

}  // namespace gomca
