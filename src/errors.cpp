#include "gomca/errors.hpp"

#include "gomca/format.hpp"

#include <string>
#include <utility>

using namespace gomca::literals;

namespace gomca {

    syntax_error::syntax_error(syntax_error_kind kind, std::string reason, std::string line)
            : std::runtime_error{"syntax error: {} ({})"_format(reason, line)},
              kind_{kind},
              reason_{std::move(reason)},
              line_{std::move(line)} {}

}  // namespace gomca
