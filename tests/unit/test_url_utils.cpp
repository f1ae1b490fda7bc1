#include <gtest/gtest.h>
#include "plexwatch/utils/url_utils.hpp"

namespace url = plexwatch::utils::url;

TEST(UrlUtilsTest, JoinUsesSingleSlash) {
    EXPECT_EQ(url::join("http://plex:32400/", "/status/sessions"), "http://plex:32400/status/sessions");
    EXPECT_EQ(url::join("http://plex:32400", "status"), "http://plex:32400/status");
    EXPECT_EQ(url::join("http://plex:32400", ""), "http://plex:32400");
}

TEST(UrlUtilsTest, QueryKeepsOrderAndEncodes) {
    EXPECT_EQ(url::query({{"mode", "queue"}, {"apikey", "a b&c"}}), "mode=queue&apikey=a%20b%26c");
    EXPECT_EQ(url::with_query("http://sab:8080", "/api", {{"output", "json"}}), "http://sab:8080/api?output=json");
    EXPECT_EQ(url::with_query("http://sab:8080", "/api", {}), "http://sab:8080/api");
}

TEST(UrlUtilsTest, EncodeLeavesUnreservedAlone) {
    EXPECT_EQ(url::encode("Az09-_.~"), "Az09-_.~");
    EXPECT_EQ(url::encode("é"), "%C3%A9");
}

TEST(UrlUtilsTest, HttpCheck) {
    EXPECT_TRUE(url::is_http("http://localhost"));
    EXPECT_TRUE(url::is_http("https://discord.com/api"));
    EXPECT_FALSE(url::is_http("https://"));
    EXPECT_FALSE(url::is_http("ftp://host"));
    EXPECT_FALSE(url::is_http("localhost:32400"));
}

TEST(UrlUtilsTest, TrimTrailingSlashes) {
    EXPECT_EQ(url::trim_trailing_slashes("http://host//"), "http://host");
    EXPECT_EQ(url::trim_trailing_slashes(""), "");
}
