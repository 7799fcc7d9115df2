#include <gtest/gtest.h>
#include "support/canned_server.hpp"
#include "support/math_server_fixture.hpp"
#include "rpcwire/client.hpp"
#include "rpcwire/error.hpp"
#include "rpcwire/logging.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <chrono>
#include <memory>
#include <sstream>
#include <vector>

using namespace rpcwire;
using namespace std::chrono_literals;

class ClientE2ETest : public MathServerTest {
protected:
    RpcClient::Options client_options() {
        RpcClient::Options opts{math_address()};
        opts.transport.timeout = 5000ms;
        opts.first_id = 100;
        return opts;
    }
};

TEST_F(ClientE2ETest, CallAssignsIncreasingIds) {
    RpcClient client(client_options());
    auto first = client.call("add", Json::array({10.5, 20.5}));
    auto second = client.call("add", Json::array({1, 1}));

    ASSERT_TRUE(first.id.has_value());
    ASSERT_TRUE(second.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*first.id), 100);
    EXPECT_EQ(std::get<int64_t>(*second.id), 101);
    EXPECT_DOUBLE_EQ(first.result->get<double>(), 31.0);
}

TEST_F(ClientE2ETest, CallWithCallerId) {
    RpcClient client(client_options());
    auto resp = client.call("mul", Json::array({2.5, 3.5}), RequestId{std::string{"corr-1"}});
    ASSERT_TRUE(resp.id.has_value());
    EXPECT_EQ(std::get<std::string>(*resp.id), "corr-1");
    EXPECT_FALSE(resp.is_error());
    EXPECT_DOUBLE_EQ(resp.result->get<double>(), 8.75);
}

TEST_F(ClientE2ETest, ErrorReplyIsNotThrownByCall) {
    RpcClient client(client_options());
    auto resp = client.call("mul", Json::array({1}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "Invalid params");
    EXPECT_FALSE(resp.result.has_value());
}

TEST_F(ClientE2ETest, CallResult) {
    RpcClient client(client_options());
    EXPECT_DOUBLE_EQ(client.call_result("div", Json::array({9, 3})).get<double>(), 3.0);
}

TEST_F(ClientE2ETest, CallResultThrowsRemoteError) {
    RpcClient client(client_options());
    try {
        (void)client.call_result("div", Json::array({1, 0}));
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
        EXPECT_EQ(e.kind(), ErrorKind::Remote);
        EXPECT_STREQ(e.what(), "Division by zero");
    }
}

TEST_F(ClientE2ETest, CallAsync) {
    RpcClient client(client_options());
    auto a = client.call_async("add", Json::array({1, 2}));
    auto b = client.call_async("mul", Json::array({3, 4}));
    EXPECT_DOUBLE_EQ(b.get().result->get<double>(), 12.0);
    EXPECT_DOUBLE_EQ(a.get().result->get<double>(), 3.0);
}

TEST_F(ClientE2ETest, ParamsConvertedFromStdTypes) {
    RpcClient client(client_options());
    std::vector<double> params = {4.0, 0.5};
    auto resp = client.call("mul", params);
    EXPECT_DOUBLE_EQ(resp.result->get<double>(), 2.0);
}

TEST_F(ClientE2ETest, EmptyMethodIsProgrammerError) {
    RpcClient client(client_options());
    EXPECT_THROW((void)client.call("", Json::array()), std::invalid_argument);
}

TEST(RpcClient, UnreachableServiceIsConnectionError) {
    RpcClient::Options opts{ServiceAddress("127.0.0.1:1", "rpc")};
    opts.transport.timeout = 2000ms;
    RpcClient client(std::move(opts));
    EXPECT_THROW((void)client.call("add", Json::array({1, 2})), ConnectionError);
}

TEST(RpcClient, CallAsyncChecksReplyIdLikeCall) {
    std::string body = R"({"jsonrpc":"2.0","result":3,"id":99})";
    test_support::CannedServer server("HTTP/1.1 200 OK\r\nContent-Length: " +
                                      std::to_string(body.size()) + "\r\n\r\n" + body);

    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    LogManager::set_level("warn");
    auto logger = LogManager::get_logger();
    logger->sinks().push_back(sink);

    RpcClient::Options opts{ServiceAddress(server.host_port(), "rpc")};
    opts.transport.timeout = 5000ms;
    RpcClient client(std::move(opts));
    auto resp = client.call_async("add", Json::array({1, 2})).get();
    logger->sinks().pop_back();

    ASSERT_TRUE(resp.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*resp.id), 99);
    EXPECT_NE(captured.str().find("does not match request id 0"), std::string::npos);
}

TEST(RpcClient, CallAsyncRejectsReplyWithoutId) {
    std::string body = R"({"jsonrpc":"2.0","result":3})";
    test_support::CannedServer server("HTTP/1.1 200 OK\r\nContent-Length: " +
                                      std::to_string(body.size()) + "\r\n\r\n" + body);
    RpcClient::Options opts{ServiceAddress(server.host_port(), "rpc")};
    opts.transport.timeout = 5000ms;
    RpcClient client(std::move(opts));
    auto pending = client.call_async("add", Json::array({1, 2}));
    EXPECT_THROW((void)pending.get(), SerializationError);
}
