#include <gtest/gtest.h>
#include "rpcwire/error.hpp"
#include "rpcwire/transport/tcp_stream.hpp"
#include "support/canned_server.hpp"
#include <chrono>
#include <thread>

using namespace rpcwire;
using namespace std::chrono_literals;

TEST(CancelSignal, StartsClearAndLatches) {
    CancelSignal sig;
    EXPECT_FALSE(sig.cancelled());
    sig.cancel();
    EXPECT_TRUE(sig.cancelled());
    sig.cancel();
    EXPECT_TRUE(sig.cancelled());
}

TEST(TcpStream, ConnectRefused) {
    auto port = test_support::unused_port();
    try {
        (void)TcpStream::connect("127.0.0.1", std::to_string(port), {});
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Connection);
    }
}

TEST(TcpStream, ResolveFailure) {
    EXPECT_THROW((void)TcpStream::connect("no-such-host.invalid", "80", {}), ConnectionError);
}

TEST(TcpStream, BadService) {
    EXPECT_THROW((void)TcpStream::connect("127.0.0.1", "not-a-port", {}), ConnectionError);
}

TEST(TcpStream, ConnectAfterCancel) {
    test_support::CannedServer server("unused");
    CancelSignal sig;
    sig.cancel();
    TcpStream::Options opts;
    opts.cancel = &sig;
    EXPECT_THROW((void)TcpStream::connect("127.0.0.1", std::to_string(server.port()), opts),
                 ConnectionError);
}

TEST(TcpStream, DeadlineStartsBeforeResolution) {
    test_support::CannedServer server("unused");
    TcpStream::Options opts;
    opts.timeout = std::chrono::milliseconds(0);
    try {
        (void)TcpStream::connect("127.0.0.1", std::to_string(server.port()), opts);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::Connection);
    }
}

TEST(TcpStream, WriteThenReadToEnd) {
    test_support::CannedServer server("pong-bytes");
    auto stream = TcpStream::connect("127.0.0.1", std::to_string(server.port()), {});
    EXPECT_TRUE(stream.is_open());
    stream.write_all("ping\r\n\r\n");
    EXPECT_EQ(stream.read_to_end(), "pong-bytes");
    EXPECT_EQ(server.received(), "ping\r\n\r\n");
}

TEST(TcpStream, ReadStopsWhenCompletionCheckPasses) {
    // The peer never closes, so only the completion check ends the read.
    test_support::CannedServer server("abcdef", true);
    TcpStream::Options opts;
    opts.timeout = 5s;
    auto stream = TcpStream::connect("127.0.0.1", std::to_string(server.port()), opts);
    stream.write_all("x\r\n\r\n");
    std::string got = stream.read_to_end([](std::string_view r) { return r.size() >= 6; });
    EXPECT_EQ(got, "abcdef");
}

TEST(TcpStream, ReadTimeout) {
    test_support::CannedServer server("", true);
    TcpStream::Options opts;
    opts.timeout = 150ms;
    auto stream = TcpStream::connect("127.0.0.1", std::to_string(server.port()), opts);
    stream.write_all("x\r\n\r\n");

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW((void)stream.read_to_end(), ResponseError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(TcpStream, ReadCancelled) {
    test_support::CannedServer server("", true);
    CancelSignal sig;
    TcpStream::Options opts;
    opts.cancel = &sig;
    auto stream = TcpStream::connect("127.0.0.1", std::to_string(server.port()), opts);
    stream.write_all("x\r\n\r\n");

    std::thread canceller([&sig]() {
        std::this_thread::sleep_for(100ms);
        sig.cancel();
    });
    EXPECT_THROW((void)stream.read_to_end(), ResponseError);
    canceller.join();
}

TEST(TcpStream, MaxReadBytes) {
    test_support::CannedServer server(std::string(10000, 'z'));
    TcpStream::Options opts;
    opts.max_read_bytes = 1000;
    auto stream = TcpStream::connect("127.0.0.1", std::to_string(server.port()), opts);
    stream.write_all("x\r\n\r\n");
    EXPECT_THROW((void)stream.read_to_end(), ResponseError);
}

TEST(TcpStream, MoveTransfersOwnership) {
    test_support::CannedServer server("ok");
    auto a = TcpStream::connect("127.0.0.1", std::to_string(server.port()), {});
    TcpStream b = std::move(a);
    EXPECT_FALSE(a.is_open());
    EXPECT_TRUE(b.is_open());
    b.close();
    EXPECT_FALSE(b.is_open());
    EXPECT_THROW(b.write_all("x"), ConnectionError);
    EXPECT_THROW((void)b.read_to_end(), ResponseError);
}
