#include <gtest/gtest.h>
#include "../src/HttpUtil.hh"

TEST(HttpUtilTest, SplitUrl)
{
    auto parts = splitUrl("https://api.example.com:8443/event/sign?x=1");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->origin, "https://api.example.com:8443");
    EXPECT_EQ(parts->path, "/event/sign?x=1");

    auto bare = splitUrl("http://localhost");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->path, "/");

    EXPECT_FALSE(splitUrl("ftp://host/file").has_value());
    EXPECT_FALSE(splitUrl("http://").has_value());
    EXPECT_FALSE(splitUrl("not a url").has_value());
}

TEST(HttpUtilTest, QueryAndPlaceholders)
{
    EXPECT_EQ(urlEncode("a b&c"), "a%20b%26c");
    EXPECT_EQ(withQuery("/solve", {{"gt", "g"}}), "/solve?gt=g");

    httplib::Params values = {{"gt", "G"}, {"challenge", "C"}};
    EXPECT_EQ(substitutePlaceholders("{gt}-{challenge}-{gt}", values), "G-C-G");

    json tmpl = {{"outer", {{"id", "{challenge}"}, {"n", 3}}}, {"list", {"{gt}", "x"}}};
    json out = substituteTemplate(tmpl, values);
    EXPECT_EQ(out["outer"]["id"], "C");
    EXPECT_EQ(out["outer"]["n"], 3);
    EXPECT_EQ(out["list"][0], "G");
}
