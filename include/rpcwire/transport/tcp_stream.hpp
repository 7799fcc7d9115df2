#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace rpcwire {

/// One-shot cancellation flag that can interrupt a blocked poll().
/// Backed by a pipe: cancel() makes the read end permanently readable.
class CancelSignal {
public:
    CancelSignal();
    ~CancelSignal();

    CancelSignal(const CancelSignal&) = delete;
    CancelSignal& operator=(const CancelSignal&) = delete;

    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

    /// Descriptor to poll for POLLIN.
    [[nodiscard]] int fd() const noexcept { return pipe_[0]; }

private:
    int pipe_[2]{-1, -1};
};

/// Blocking TCP byte stream. Owns its socket and closes it on destruction.
///
/// Every operation waits with poll(), so each one honors the timeout and
/// returns as soon as the cancel signal fires.
class TcpStream {
public:
    struct Options {
        /// Bound applied separately to connect, write and read.
        std::optional<std::chrono::milliseconds> timeout;
        const CancelSignal* cancel = nullptr;
        std::size_t max_read_bytes = 16 * 1024 * 1024;
    };

    /// Returns true once the bytes read so far form a complete message.
    using CompletionCheck = std::function<bool(std::string_view received)>;

    /// Resolve and connect. Throws ConnectionError on DNS failure, refusal,
    /// timeout or cancellation.
    [[nodiscard]] static TcpStream connect(const std::string& host,
                                           const std::string& service,
                                           Options opts);

    ~TcpStream();

    TcpStream(TcpStream&& other) noexcept;
    TcpStream& operator=(TcpStream&& other) noexcept;
    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    /// Write every byte of `data`. Throws ConnectionError on failure.
    void write_all(std::string_view data);

    /// Read until the peer closes the stream, or until `complete` reports a
    /// whole message. Throws ResponseError on socket failure, timeout,
    /// cancellation or when max_read_bytes is exceeded.
    [[nodiscard]] std::string read_to_end(const CompletionCheck& complete = nullptr);

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    void close() noexcept;

private:
    TcpStream(int fd, Options opts) noexcept;

    int fd_ = -1;
    Options opts_;
};

} // namespace rpcwire
