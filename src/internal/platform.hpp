#pragma once

#include <string_view>

namespace gomca::internal::platform {
    using namespace std::string_view_literals;

    namespace tool {
        inline constexpr auto go = "go"sv;
        inline constexpr auto llvm_mca = "llvm-mca"sv;
        inline constexpr auto go_path = std::string_view{GOMCA_GO_EXECUTABLE_PATH};
        inline constexpr auto llvm_mca_path = std::string_view{GOMCA_LLVM_MCA_EXECUTABLE_PATH};
    }  // namespace tool

}  // namespace gomca::internal::platform
