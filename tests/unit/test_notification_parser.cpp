/**
 * @file test_notification_parser.cpp
 * @brief Unit tests for SSDP response header parsing and usn deduplication
 */

#include <gtest/gtest.h>
#include <ssdp_discovery.hpp>

#include <set>
#include <string>
#include <vector>

using namespace discovery;

namespace {

const char* basic_response =
    "HTTP/1.1 200 OK\r\n"
    "USN: uuid:abc::urn:schemas-upnp-org:device:Basic:1\r\n"
    "LOCATION: http://10.0.0.5:80/desc.xml\r\n"
    "ST: urn:schemas-upnp-org:device:Basic:1\r\n"
    "CACHE-CONTROL: max-age=1800\r\n"
    "SERVER: test\r\n"
    "\r\n";

std::string make_response(const std::string& usn, const std::string& server,
                          const std::string& location = "http://10.0.0.5:80/desc.xml") {
    return "HTTP/1.1 200 OK\r\n"
           "CACHE-CONTROL: max-age=120\r\n"
           "EXT:\r\n"
           "LOCATION: " + location + "\r\n"
           "SERVER: " + server + "\r\n"
           "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
           "USN: " + usn + "\r\n"
           "\r\n";
}

} // namespace

TEST(HeaderParserTest, LowercasesNamesAndTrimsValues) {
    header_map headers = parse_headers("HTTP/1.1 200 OK\r\nHOST: 239.255.255.250:1900\r\nX-Custom:   spaced value  \r\n\r\n");

    ASSERT_EQ(headers.count("host"), 1u);
    EXPECT_EQ(headers["host"], "239.255.255.250:1900");
    EXPECT_EQ(headers["x-custom"], "spaced value");
    EXPECT_EQ(headers.size(), 2u);
}

TEST(HeaderParserTest, ValueIsEverythingAfterFirstColon) {
    header_map headers = parse_headers("LOCATION: http://192.168.1.2:49152/desc.xml\r\n");
    EXPECT_EQ(headers["location"], "http://192.168.1.2:49152/desc.xml");
}

TEST(HeaderParserTest, AcceptsBareLineFeeds) {
    header_map headers = parse_headers("HTTP/1.1 200 OK\nUSN: uuid:1\nST: ssdp:all\n\n");
    EXPECT_EQ(headers["usn"], "uuid:1");
    EXPECT_EQ(headers["st"], "ssdp:all");
}

TEST(HeaderParserTest, LastDuplicateWins) {
    header_map headers = parse_headers("Server: first\r\nSERVER: second\r\n");
    EXPECT_EQ(headers["server"], "second");
}

TEST(HeaderParserTest, EmptyValueIsKept) {
    header_map headers = parse_headers("EXT:\r\n");
    ASSERT_EQ(headers.count("ext"), 1u);
    EXPECT_TRUE(headers["ext"].empty());
}

TEST(NotificationParserTest, ParsesBasicResponse) {
    auto res = parse_response(basic_response);
    ASSERT_TRUE(res.has_value());

    EXPECT_EQ(res->usn, "uuid:abc::urn:schemas-upnp-org:device:Basic:1");
    EXPECT_EQ(res->location, "http://10.0.0.5:80/desc.xml");
    EXPECT_EQ(res->st, "urn:schemas-upnp-org:device:Basic:1");
    EXPECT_EQ(res->cache_control, "max-age=1800");
    EXPECT_EQ(res->server, "test");
    EXPECT_EQ(res->max_age(), 1800);
}

TEST(NotificationParserTest, KeepsOptionalHeaders) {
    auto res = parse_response(make_response("uuid:1", "linux"));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->headers.count("ext"), 1u);
}

TEST(NotificationParserTest, MissingLocationDropsResponse) {
    const char* response =
        "HTTP/1.1 200 OK\r\n"
        "USN: uuid:abc\r\n"
        "ST: upnp:rootdevice\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "SERVER: test\r\n"
        "\r\n";
    EXPECT_FALSE(parse_response(response).has_value());
}

TEST(NotificationParserTest, EachRequiredHeaderIsMandatory) {
    const std::vector<std::string> lines = {
        "USN: uuid:abc\r\n",
        "LOCATION: http://10.0.0.5/d.xml\r\n",
        "ST: upnp:rootdevice\r\n",
        "CACHE-CONTROL: max-age=1800\r\n",
        "SERVER: test\r\n",
    };

    for (size_t skip = 0; skip < lines.size(); ++skip) {
        std::string response = "HTTP/1.1 200 OK\r\n";
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i != skip)
                response += lines[i];
        }
        response += "\r\n";
        EXPECT_FALSE(parse_response(response).has_value()) << "missing line " << lines[skip];
    }
}

TEST(NotificationParserTest, HeaderNamesAreCaseInsensitive) {
    const char* response =
        "HTTP/1.1 200 OK\r\n"
        "usn: uuid:abc\r\n"
        "Location: http://10.0.0.5/d.xml\r\n"
        "st: upnp:rootdevice\r\n"
        "Cache-Control: max-age=60\r\n"
        "Server: test\r\n"
        "\r\n";
    auto res = parse_response(response);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->location, "http://10.0.0.5/d.xml");
    EXPECT_EQ(res->max_age(), 60);
}

TEST(NotificationParserTest, MaxAgeWithoutValue) {
    ssdp_res res;
    res.cache_control = "no-cache";
    EXPECT_FALSE(res.max_age().has_value());

    res.cache_control = "max-age = 300";
    EXPECT_EQ(res.max_age(), 300);
}

TEST(NotificationParserTest, DuplicateUsnKeepsFirstProcessed) {
    std::vector<std::string> responses = {
        make_response("uuid:dup", "first"),
        make_response("uuid:dup", "second"),
    };

    std::vector<ssdp_res> devices = parse_responses(responses);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].server, "first");
}

TEST(NotificationParserTest, OutputHasUniqueUsns) {
    std::vector<std::string> responses = {
        make_response("uuid:a", "s1"),
        make_response("uuid:b", "s1"),
        make_response("uuid:a", "s2"),
        "garbage without headers",
        make_response("uuid:c", "s1"),
        make_response("uuid:b", "s3"),
    };

    std::vector<ssdp_res> devices = parse_responses(responses);
    std::set<std::string> usns;
    for (const auto& d : devices)
        EXPECT_TRUE(usns.insert(d.usn).second) << "duplicate " << d.usn;

    EXPECT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].usn, "uuid:a");
    EXPECT_EQ(devices[1].usn, "uuid:b");
    EXPECT_EQ(devices[2].usn, "uuid:c");
}

TEST(NotificationParserTest, IncompleteResponsesAreSkipped) {
    std::vector<std::string> responses = {
        "HTTP/1.1 200 OK\r\nUSN: uuid:x\r\n\r\n",
        basic_response,
    };

    std::vector<ssdp_res> devices = parse_responses(responses);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].usn, "uuid:abc::urn:schemas-upnp-org:device:Basic:1");
}
