#include <gtest/gtest.h>

#include "request_target.hpp"
#include "uuid.hpp"

using namespace zt;

TEST(RequestTarget, SplitsPathAndQuery) {
    RequestTarget t("/trace?uuid=abc&x=1%202&flag&x=3#frag");
    EXPECT_EQ(t.path, "/trace");
    EXPECT_EQ(t.single("uuid"), std::optional<std::string>("abc"));
    EXPECT_EQ(t.single("flag"), std::optional<std::string>(""));
    EXPECT_FALSE(t.single("x").has_value()); // appears twice
    EXPECT_EQ(t.query.count("x"), 2u);
    EXPECT_FALSE(t.single("missing").has_value());
}

TEST(RequestTarget, DecodesPercentAndPlus) {
    EXPECT_EQ(percent_decode("a+b%2Fc"), "a b/c");
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
    EXPECT_EQ(RequestTarget("").path, "/");
}

TEST(Uuid, AcceptsCanonicalForm) {
    EXPECT_TRUE(is_valid_uuid("6f1c2a3b-4d5e-4f60-8a71-92b3c4d5e6f7"));
    EXPECT_TRUE(is_valid_uuid("6F1C2A3B-4D5E-4F60-8A71-92B3C4D5E6F7"));
    EXPECT_FALSE(is_valid_uuid(""));
    EXPECT_FALSE(is_valid_uuid("6f1c2a3b4d5e4f608a7192b3c4d5e6f7"));
    EXPECT_FALSE(is_valid_uuid("6f1c2a3b-4d5e-4f60-8a71-92b3c4d5e6fz"));
    EXPECT_FALSE(is_valid_uuid(" 6f1c2a3b-4d5e-4f60-8a71-92b3c4d5e6f7"));
}
