#pragma once

#include "fd.hpp"

#include "gomca/pipeline.hpp"

extern "C" {
#include <sys/types.h>
}

#include <memory>

namespace gomca::internal {

    /*
     * One external child process. Pipes requested before start() are created
     * close-on-exec, so only the intended child ever holds the other end; stderr is
     * inherited. A started child must be reaped with wait(); the destructor reaps it
     * as a last resort and blocks until it exits.
     */
    class process {
      public:
        explicit process(command cmd);
        ~process();

        process(const process&) = delete;
        process& operator=(const process&) = delete;

        // Parent side of the child's stdout.
        std::unique_ptr<fd_reader> stdout_pipe();
        // Parent side of the child's stdin.
        std::unique_ptr<fd_writer> stdin_pipe();

        void start();
        void wait();

        const command& cmd() const noexcept { return cmd_; }
        pid_t pid() const noexcept { return pid_; }

      private:
        command cmd_;
        unique_fd child_stdin_{};
        unique_fd child_stdout_{};
        pid_t pid_{-1};
        bool waited_{false};
    };

    // SIGPIPE is ignored so writing to an exited consumer fails with EPIPE.
    void ignore_sigpipe();

}  // namespace gomca::internal
