#pragma once

extern "C" {
#include <unistd.h>
}

#include <array>
#include <cerrno>
#include <istream>
#include <ostream>
#include <streambuf>
#include <system_error>
#include <utility>

namespace gomca::internal {

    class unique_fd {
      public:
        unique_fd() = default;
        explicit unique_fd(int fd) noexcept : fd_{fd} {}

        unique_fd(const unique_fd&) = delete;
        unique_fd& operator=(const unique_fd&) = delete;

        unique_fd(unique_fd&& other) noexcept : fd_{other.release()} {}
        unique_fd& operator=(unique_fd&& other) noexcept {
            if (this != &other) {
                (void)reset();
                fd_ = other.release();
            }
            return *this;
        }

        ~unique_fd() { (void)reset(); }

        int get() const noexcept { return fd_; }
        explicit operator bool() const noexcept { return fd_ >= 0; }

        int release() noexcept { return std::exchange(fd_, -1); }

        // Closes the descriptor if still open; later calls are no-ops.
        bool reset() noexcept {
            if (fd_ < 0) {
                return true;
            }
            auto fd = std::exchange(fd_, -1);
            return ::close(fd) == 0;
        }

      private:
        int fd_{-1};
    };

    class fd_streambuf : public std::streambuf {
      public:
        explicit fd_streambuf(int fd) noexcept : fd_{fd} { setp(out_buf_.data(), out_buf_.data() + out_buf_.size()); }

        int error() const noexcept { return last_errno_; }

      protected:
        int_type underflow() override {
            if (gptr() < egptr()) {
                return traits_type::to_int_type(*gptr());
            }
            ssize_t n = 0;
            do {
                n = ::read(fd_, in_buf_.data(), in_buf_.size());
            } while (n < 0 && errno == EINTR);
            if (n < 0) {
                // surfaces as badbit on the owning istream
                last_errno_ = errno;
                throw std::system_error{last_errno_, std::generic_category(), "read"};
            }
            if (n == 0) {
                return traits_type::eof();
            }
            setg(in_buf_.data(), in_buf_.data(), in_buf_.data() + n);
            return traits_type::to_int_type(*gptr());
        }

        int_type overflow(int_type ch) override {
            if (!drain()) {
                return traits_type::eof();
            }
            if (!traits_type::eq_int_type(ch, traits_type::eof())) {
                *pptr() = traits_type::to_char_type(ch);
                pbump(1);
            }
            return traits_type::not_eof(ch);
        }

        int sync() override { return drain() ? 0 : -1; }

      private:
        bool drain() {
            auto* cursor = pbase();
            while (cursor < pptr()) {
                auto n = ::write(fd_, cursor, static_cast<size_t>(pptr() - cursor));
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    last_errno_ = errno;
                    return false;
                }
                cursor += n;
            }
            setp(out_buf_.data(), out_buf_.data() + out_buf_.size());
            return true;
        }

        int fd_;
        int last_errno_{0};
        std::array<char, 4096> in_buf_{};
        std::array<char, 4096> out_buf_{};
    };

    // Read end of a pipe exposed as std::istream; closed on destruction.
    class fd_reader {
      public:
        explicit fd_reader(unique_fd fd) : fd_{std::move(fd)}, buf_{fd_.get()}, stream_{&buf_} {}

        fd_reader(const fd_reader&) = delete;
        fd_reader& operator=(const fd_reader&) = delete;

        std::istream& stream() noexcept { return stream_; }
        bool is_open() const noexcept { return static_cast<bool>(fd_); }
        bool close() noexcept { return fd_.reset(); }

      private:
        unique_fd fd_;
        fd_streambuf buf_;
        std::istream stream_;
    };

    // Write end of a pipe exposed as std::ostream; closed on destruction.
    class fd_writer {
      public:
        explicit fd_writer(unique_fd fd) : fd_{std::move(fd)}, buf_{fd_.get()}, stream_{&buf_} {}

        fd_writer(const fd_writer&) = delete;
        fd_writer& operator=(const fd_writer&) = delete;

        ~fd_writer() { (void)close(); }

        std::ostream& stream() noexcept { return stream_; }
        bool is_open() const noexcept { return static_cast<bool>(fd_); }

        // Flushes pending output and closes; the peer reads end-of-file afterwards.
        bool close() noexcept {
            if (!fd_) {
                return true;
            }
            auto flushed = buf_.pubsync() == 0;
            return fd_.reset() && flushed;
        }

      private:
        unique_fd fd_;
        fd_streambuf buf_;
        std::ostream stream_;
    };

}  // namespace gomca::internal
