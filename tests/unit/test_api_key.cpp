#include <gtest/gtest.h>
#include "rpcwire/api_key.hpp"

using namespace rpcwire;

TEST(ApiKey, Renderings) {
    ApiKey key("API_KEY", "my-api-key.xxx.yyy.zzz");
    EXPECT_EQ(key.as_query_str(), "API_KEY=my-api-key.xxx.yyy.zzz");
    EXPECT_EQ(key.as_header(), "API_KEY: my-api-key.xxx.yyy.zzz");
    EXPECT_EQ(key.as_cookie(), "Cookie: API_KEY=my-api-key.xxx.yyy.zzz");
}

TEST(ApiKey, Accessors) {
    ApiKey key("X-Token", "t0k");
    EXPECT_EQ(key.name(), "X-Token");
    EXPECT_EQ(key.value(), "t0k");
}
