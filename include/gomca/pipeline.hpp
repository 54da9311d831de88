#pragma once

#include "config.hpp"
#include "transform.hpp"
#include "utils.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace gomca {

    struct command {
        std::vector<std::string> argv{};

        static constexpr bool to_string_formattable = true;
        std::string to_string() const { return utils::join_with_separator(argv, " "sv); }

        std::string_view name() const noexcept { return argv.empty() ? std::string_view{} : argv.front(); }
    };

    // `go tool objdump -gnu -s REGEXP BINARY`
    command objdump_command(const tool_config& tools, std::string_view symbol_regex, const std::filesystem::path& binary);

    // `llvm-mca ARGS...`
    command mca_command(const tool_config& tools, const std::vector<std::string>& mca_args);

    /*
     * Runs activities concurrently and joins them. When several fail, wait() rethrows
     * the failure of the activity that was started first; the rest are dropped.
     */
    class task_group {
      public:
        task_group() = default;
        task_group(const task_group&) = delete;
        task_group& operator=(const task_group&) = delete;

        template <typename F>
        void go(F&& task) {
            auto index = tasks_.size();
            tasks_.emplace_back([this, index, fn = std::forward<F>(task)]() mutable {
                try {
                    fn();
                } catch (...) {
                    record_failure(index, std::current_exception());
                }
            });
        }

        void wait();

        size_t size() const noexcept { return tasks_.size(); }

      private:
        void record_failure(size_t index, std::exception_ptr error);

        std::mutex mutex_{};
        std::optional<size_t> failed_index_{};
        std::exception_ptr failure_{};
        std::vector<std::jthread> tasks_{};
    };

    /*
     * Connects `producer` stdout to `consumer` stdin through `transform`.
     *
     * Three activities run concurrently: the transform (which closes the consumer's
     * stdin however it ends, the consumer's only end-of-stream signal, then discards
     * whatever the producer writes past the stop point), a wait on the
     * producer and a wait on the consumer. The first failure in that order is rethrown.
     * Neither process is cancelled when another activity fails, and nothing times out.
     */
    transform_summary run_pipeline(const command& producer, const command& consumer, const stream_transform& transform);

}  // namespace gomca
