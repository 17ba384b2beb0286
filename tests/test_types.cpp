#include <gtest/gtest.h>
#include <core/types.hpp>

TEST(SocketPolicyParse, TruthyValues) {
    for (const char* v : {"y", "yes", "t", "true", "on", "1"}) {
        auto p = parse_socket_policy(v);
        ASSERT_TRUE(p.has_value()) << v;
        EXPECT_EQ(*p, SocketPolicy::CreateAlways) << v;
    }
}

TEST(SocketPolicyParse, FalsyValues) {
    for (const char* v : {"n", "no", "f", "false", "off", "0"}) {
        auto p = parse_socket_policy(v);
        ASSERT_TRUE(p.has_value()) << v;
        EXPECT_EQ(*p, SocketPolicy::ReuseAlways) << v;
    }
}

TEST(SocketPolicyParse, Infer) {
    EXPECT_EQ(parse_socket_policy("infer"), SocketPolicy::Infer);
}

TEST(SocketPolicyParse, RejectsUnknown) {
    EXPECT_FALSE(parse_socket_policy("").has_value());
    EXPECT_FALSE(parse_socket_policy("maybe").has_value());
    EXPECT_FALSE(parse_socket_policy("2").has_value());
}

TEST(SocketPolicyParse, NameRoundTrip) {
    for (auto p : {SocketPolicy::CreateAlways, SocketPolicy::ReuseAlways, SocketPolicy::Infer}) {
        EXPECT_EQ(parse_socket_policy(socket_policy_name(p)), p);
    }
}
