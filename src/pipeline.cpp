#include "gomca/pipeline.hpp"

#include "gomca/errors.hpp"
#include "gomca/format.hpp"
#include "gomca/utils.hpp"

#include "internal/process.hpp"

#include <exception>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace gomca::literals;

namespace gomca {

    command objdump_command(const tool_config& tools, std::string_view symbol_regex, const std::filesystem::path& binary) {
        return command{.argv = {tools.go_path.string(), "tool", "objdump", "-gnu", "-s", std::string{symbol_regex},
                                binary.string()}};
    }

    command mca_command(const tool_config& tools, const std::vector<std::string>& mca_args) {
        command cmd{.argv = {tools.mca_path.string()}};
        cmd.argv.insert(cmd.argv.end(), mca_args.begin(), mca_args.end());
        return cmd;
    }

    void task_group::record_failure(size_t index, std::exception_ptr error) {
        std::lock_guard lock{mutex_};
        if (!failed_index_ || index < *failed_index_) {
            failed_index_ = index;
            failure_ = std::move(error);
        }
    }

    void task_group::wait() {
        for (auto& task : tasks_) {
            if (task.joinable()) {
                task.join();
            }
        }
        tasks_.clear();

        std::exception_ptr failure{};
        {
            std::lock_guard lock{mutex_};
            failure = std::exchange(failure_, nullptr);
            failed_index_.reset();
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    transform_summary run_pipeline(const command& producer, const command& consumer, const stream_transform& transform) {
        internal::ignore_sigpipe();

        internal::process producer_proc{producer};
        auto producer_output = producer_proc.stdout_pipe();

        internal::process consumer_proc{consumer};
        auto consumer_input = consumer_proc.stdin_pipe();

        transform_summary summary{};
        task_group tasks{};

        tasks.go([&transform, &summary, &producer, &consumer, output = std::move(producer_output),
                  input = std::move(consumer_input)]() mutable {
            // owned by this activity; both ends close when it returns or throws
            auto source = std::move(output);
            auto sink = std::move(input);
            summary = transform.run(source->stream(), sink->stream());
            if (!sink->close()) {
                throw io_error{"failed to close {} input"_format(consumer.name())};
            }

            // output past the stop point is discarded so the producer can run to completion
            auto& rest = source->stream();
            rest.ignore(std::numeric_limits<std::streamsize>::max());
            if (rest.bad()) {
                throw io_error{"failed to read {} output"_format(producer.name())};
            }
        });

        producer_proc.start();
        consumer_proc.start();

        tasks.go([&producer_proc] { producer_proc.wait(); });
        tasks.go([&consumer_proc] { consumer_proc.wait(); });
        tasks.wait();

        debug_log("pipeline finished: ", summary.instructions, " instructions");
        return summary;
    }

}  // namespace gomca
