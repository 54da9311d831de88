#include "process.hpp"

#include "gomca/errors.hpp"
#include "gomca/format.hpp"

extern "C" {
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

using namespace gomca::literals;

namespace gomca::internal {

    namespace detail {

        struct pipe_pair {
            unique_fd read_end{};
            unique_fd write_end{};
        };

        static pipe_pair make_pipe(const command& cmd) {
            int fds[2] = {-1, -1};
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                throw process_error{"{}: failed to create pipe: {}"_format(cmd.name(), std::strerror(errno))};
            }
            return pipe_pair{.read_end = unique_fd{fds[0]}, .write_end = unique_fd{fds[1]}};
        }

        // Only async-signal-safe calls between fork and exec.
        [[noreturn]] static void exec_child(char** argv, int stdin_fd, int stdout_fd, int status_fd) {
            ::signal(SIGPIPE, SIG_DFL);
            auto redirected = (stdin_fd < 0 || ::dup2(stdin_fd, STDIN_FILENO) >= 0) &&
                              (stdout_fd < 0 || ::dup2(stdout_fd, STDOUT_FILENO) >= 0);
            if (redirected) {
                ::execvp(argv[0], argv);
            }
            int err = errno;
            (void)!::write(status_fd, &err, sizeof(err));
            _exit(127);
        }

    }  // namespace detail

    process::process(command cmd) : cmd_{std::move(cmd)} {
        if (cmd_.argv.empty()) {
            throw process_error{"empty command"};
        }
    }

    process::~process() {
        if (pid_ > 0 && !waited_) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        }
    }

    std::unique_ptr<fd_reader> process::stdout_pipe() {
        if (child_stdout_ || pid_ > 0) {
            throw process_error{"{}: stdout pipe already set"_format(cmd_.name())};
        }
        auto pipe = detail::make_pipe(cmd_);
        child_stdout_ = std::move(pipe.write_end);
        return std::make_unique<fd_reader>(std::move(pipe.read_end));
    }

    std::unique_ptr<fd_writer> process::stdin_pipe() {
        if (child_stdin_ || pid_ > 0) {
            throw process_error{"{}: stdin pipe already set"_format(cmd_.name())};
        }
        auto pipe = detail::make_pipe(cmd_);
        child_stdin_ = std::move(pipe.read_end);
        return std::make_unique<fd_writer>(std::move(pipe.write_end));
    }

    void process::start() {
        if (pid_ > 0) {
            throw process_error{"{}: already started"_format(cmd_.name())};
        }

        // the parent's copies of the child ends are closed however start() exits,
        // otherwise the peer of each pipe would never observe end-of-file
        auto child_stdin = std::move(child_stdin_);
        auto child_stdout = std::move(child_stdout_);

        std::vector<char*> argv{};
        argv.reserve(cmd_.argv.size() + 1U);
        for (auto& arg : cmd_.argv) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        // exec failure is reported through this pipe; a successful exec closes it
        auto status = detail::make_pipe(cmd_);

        debug_log("starting ", cmd_.to_string());
        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            throw process_error{"failed to start {}: fork: {}"_format(cmd_.name(), std::strerror(err))};
        }

        if (pid == 0) {
            detail::exec_child(argv.data(), child_stdin.get(), child_stdout.get(), status.write_end.get());
        }

        pid_ = pid;
        (void)status.write_end.reset();
        (void)child_stdin.reset();
        (void)child_stdout.reset();

        int child_errno = 0;
        ssize_t n = 0;
        do {
            n = ::read(status.read_end.get(), &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);

        if (n > 0) {
            int ignored = 0;
            while (::waitpid(pid_, &ignored, 0) < 0 && errno == EINTR) {}
            waited_ = true;
            throw process_error{"failed to start {}: {}"_format(cmd_.name(), std::strerror(child_errno))};
        }
    }

    void process::wait() {
        if (pid_ <= 0) {
            throw process_error{"{}: not started"_format(cmd_.name())};
        }
        if (waited_) {
            throw process_error{"{}: wait was already called"_format(cmd_.name())};
        }

        int status = 0;
        pid_t rc = 0;
        do {
            rc = ::waitpid(pid_, &status, 0);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            throw process_error{"{}: waitpid failed: {}"_format(cmd_.name(), std::strerror(errno))};
        }
        waited_ = true;

        if (WIFEXITED(status)) {
            auto code = WEXITSTATUS(status);
            if (code != 0) {
                throw process_error{"{}: exit status {}"_format(cmd_.name(), code)};
            }
            debug_log(cmd_.name(), " exited");
            return;
        }
        if (WIFSIGNALED(status)) {
            throw process_error{"{}: signal: {}"_format(cmd_.name(), ::strsignal(WTERMSIG(status)))};
        }
        throw process_error{"{}: unexpected wait status {}"_format(cmd_.name(), status)};
    }

    void ignore_sigpipe() {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        ::sigemptyset(&action.sa_mask);
        if (::sigaction(SIGPIPE, &action, nullptr) != 0) {
            throw process_error{"failed to ignore SIGPIPE: {}"_format(std::strerror(errno))};
        }
    }

}  // namespace gomca::internal
