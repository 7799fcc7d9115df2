#include "rpcwire/transport/tcp_stream.hpp"
#include "rpcwire/error.hpp"
#include "rpcwire/logging.hpp"
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <system_error>
#include <utility>

namespace rpcwire {

namespace {

using Clock = std::chrono::steady_clock;

enum class WaitResult { Ready, TimedOut, Cancelled, Failed };

std::optional<Clock::time_point> deadline_from(const std::optional<std::chrono::milliseconds>& timeout) {
    if (!timeout) return std::nullopt;
    return Clock::now() + *timeout;
}

// Wait for `events` on `fd`, or for the cancel signal, or for the deadline.
WaitResult wait_for(int fd, short events,
                    const std::optional<Clock::time_point>& deadline,
                    const CancelSignal* cancel) {
    while (true) {
        struct pollfd fds[2];
        fds[0].fd = fd;
        fds[0].events = events;
        fds[0].revents = 0;
        fds[1].fd = cancel ? cancel->fd() : -1;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int timeout_ms = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            if (left.count() <= 0) return WaitResult::TimedOut;
            timeout_ms = static_cast<int>(left.count());
        }

        int ret = ::poll(fds, cancel ? 2 : 1, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return WaitResult::Failed;
        }
        if (ret == 0) return WaitResult::TimedOut;

        if (cancel && (fds[1].revents & POLLIN)) return WaitResult::Cancelled;
        // POLLERR / POLLHUP are surfaced by the following send/recv/getsockopt.
        if (fds[0].revents) return WaitResult::Ready;
    }
}

std::string errno_text(int err) {
    return std::strerror(err);
}

struct ConnectAttempt {
    int fd = -1;
    WaitResult wait = WaitResult::Ready;
    std::string detail;

    // Timeout and cancellation apply to the whole call, not one address.
    [[nodiscard]] bool exhausted() const noexcept {
        return wait == WaitResult::TimedOut || wait == WaitResult::Cancelled;
    }
};

// Connect one resolved address. On failure fd is -1 and detail is set.
ConnectAttempt connect_one(const struct addrinfo* ai,
                           const std::optional<Clock::time_point>& deadline,
                           const CancelSignal* cancel) {
    ConnectAttempt attempt;
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
        attempt.detail = "socket(): " + errno_text(errno);
        return attempt;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        attempt.fd = fd;
        return attempt;
    }
    if (errno != EINPROGRESS) {
        attempt.detail = errno_text(errno);
        ::close(fd);
        return attempt;
    }

    attempt.wait = wait_for(fd, POLLOUT, deadline, cancel);
    switch (attempt.wait) {
        case WaitResult::Ready:
            break;
        case WaitResult::TimedOut:
            attempt.detail = "connect timed out";
            ::close(fd);
            return attempt;
        case WaitResult::Cancelled:
            attempt.detail = "operation cancelled";
            ::close(fd);
            return attempt;
        case WaitResult::Failed:
            attempt.detail = "poll(): " + errno_text(errno);
            ::close(fd);
            return attempt;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        so_error = errno;
    }
    if (so_error != 0) {
        attempt.detail = errno_text(so_error);
        ::close(fd);
        return attempt;
    }
    attempt.fd = fd;
    return attempt;
}

} // anonymous namespace

// ---------- CancelSignal ----------

CancelSignal::CancelSignal() {
    if (::pipe2(pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

CancelSignal::~CancelSignal() {
    if (pipe_[0] >= 0) ::close(pipe_[0]);
    if (pipe_[1] >= 0) ::close(pipe_[1]);
}

void CancelSignal::cancel() noexcept {
    if (cancelled()) return;
    char b = 1;
    // EAGAIN means the pipe is full, which already reads as cancelled.
    if (::write(pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
        RPCWIRE_LOG_NET_WARN("cancel signal write failed: {}", std::strerror(errno));
    }
}

bool CancelSignal::cancelled() const noexcept {
    struct pollfd pfd;
    pfd.fd = pipe_[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN);
}

// ---------- TcpStream ----------

TcpStream::TcpStream(int fd, Options opts) noexcept
    : fd_(fd), opts_(std::move(opts)) {}

TcpStream::~TcpStream() {
    close();
}

TcpStream::TcpStream(TcpStream&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), opts_(std::move(other.opts_)) {}

TcpStream& TcpStream::operator=(TcpStream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        opts_ = std::move(other.opts_);
    }
    return *this;
}

void TcpStream::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

TcpStream TcpStream::connect(const std::string& host, const std::string& service, Options opts) {
    const std::string target = host + ":" + service;
    if (opts.cancel && opts.cancel->cancelled()) {
        throw ConnectionError("connect to " + target + " failed: operation cancelled");
    }

    // The deadline covers resolution too, but getaddrinfo() itself cannot be
    // interrupted; a stalled resolver is only detected once it returns.
    auto deadline = deadline_from(opts.timeout);

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int err = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (err != 0) {
        throw ConnectionError("resolve " + target + " failed: " + ::gai_strerror(err));
    }
    std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    if (deadline && Clock::now() >= *deadline) {
        throw ConnectionError("connect to " + target + " failed: timed out resolving address");
    }
    if (opts.cancel && opts.cancel->cancelled()) {
        throw ConnectionError("connect to " + target + " failed: operation cancelled");
    }

    std::string detail = "no usable address";
    for (const struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        ConnectAttempt attempt = connect_one(ai, deadline, opts.cancel);
        if (attempt.fd >= 0) {
            RPCWIRE_LOG_NET_DEBUG("connected to {}", target);
            return TcpStream(attempt.fd, std::move(opts));
        }
        detail = std::move(attempt.detail);
        RPCWIRE_LOG_NET_DEBUG("connect attempt to {} failed: {}", target, detail);
        if (attempt.exhausted()) break;
    }
    throw ConnectionError("connect to " + target + " failed: " + detail);
}

void TcpStream::write_all(std::string_view data) {
    if (fd_ < 0) throw ConnectionError("write failed: stream is closed");

    auto deadline = deadline_from(opts_.timeout);
    const char* p = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t n = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (n >= 0) {
            p += n;
            remaining -= static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw ConnectionError("write failed: " + errno_text(errno));
        }
        switch (wait_for(fd_, POLLOUT, deadline, opts_.cancel)) {
            case WaitResult::Ready:     break;
            case WaitResult::TimedOut:  throw ConnectionError("write timed out");
            case WaitResult::Cancelled: throw ConnectionError("write failed: operation cancelled");
            case WaitResult::Failed:    throw ConnectionError("write failed: poll(): " + errno_text(errno));
        }
    }
    RPCWIRE_LOG_NET_TRACE("wrote {} bytes", data.size());
}

std::string TcpStream::read_to_end(const CompletionCheck& complete) {
    if (fd_ < 0) throw ResponseError("read failed: stream is closed");

    auto deadline = deadline_from(opts_.timeout);
    std::string received;
    char chunk[4096];

    while (true) {
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            received.append(chunk, static_cast<std::size_t>(n));
            if (received.size() > opts_.max_read_bytes) {
                throw ResponseError("response exceeds " + std::to_string(opts_.max_read_bytes) + " bytes");
            }
            if (complete && complete(received)) break;
            continue;
        }
        if (n == 0) break;  // EOF
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw ResponseError("read failed: " + errno_text(errno));
        }
        switch (wait_for(fd_, POLLIN, deadline, opts_.cancel)) {
            case WaitResult::Ready:     break;
            case WaitResult::TimedOut:  throw ResponseError("read timed out");
            case WaitResult::Cancelled: throw ResponseError("read failed: operation cancelled");
            case WaitResult::Failed:    throw ResponseError("read failed: poll(): " + errno_text(errno));
        }
    }
    RPCWIRE_LOG_NET_TRACE("read {} bytes", received.size());
    return received;
}

} // namespace rpcwire
