#pragma once

#include "gomca.hpp"

#include <catch2/catch_test_macros.hpp>

#include "../src/internal/fd.hpp"
#include "../src/internal/process.hpp"

extern "C" {
#include <unistd.h>
}

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gomca::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(const std::string& prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        out << text;
    }

    inline command shell(std::string script) {
        return command{.argv = {"/bin/sh", "-c", std::move(script)}};
    }

    inline std::string transform_text(std::string_view input, transform_config config = {}) {
        std::istringstream in{std::string{input}};
        std::ostringstream out{};
        stream_transform{std::move(config)}.run(in, out);
        return out.str();
    }
}  // namespace gomca::test::detail
