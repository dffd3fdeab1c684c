/**
 * @file test_http_message.cpp
 * @brief Unit tests for HTTP request and response text handling
 */

#include <gtest/gtest.h>
#include <http/request.hpp>
#include <http/response.hpp>

#include <stdexcept>
#include <string>

TEST(HttpRequestTest, BuildsGetRequest) {
    http::request req {"GET", "/desc.xml"};
    req.set_header("Host", "10.0.0.5:80");
    req.set_header("Connection", "close");

    std::string text = req.to_string();
    EXPECT_EQ(text.rfind("GET /desc.xml HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(text.find("Host: 10.0.0.5:80\r\n"), std::string::npos);
    EXPECT_NE(text.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 4), "\r\n\r\n");
}

TEST(HttpRequestTest, ParsesRequestLineAndHeaders) {
    http::request req {std::string_view {"GET /dev/desc.xml?x=1 HTTP/1.1\r\nHOST: 10.0.0.5\r\nAccept:  */* \r\n\r\n"}};

    EXPECT_EQ(req.get_method(), "GET");
    EXPECT_EQ(req.get_resource(), "/dev/desc.xml?x=1");
    EXPECT_EQ(req.get_path(), "/dev/desc.xml");
    EXPECT_EQ(req.get_protocol(), "HTTP/1.1");
    EXPECT_TRUE(req.check_header("host"));
    EXPECT_EQ(req.get_header("Host"), "10.0.0.5");
    EXPECT_EQ(req.get_header("accept"), "*/*");
    EXPECT_EQ(req.get_header("missing"), "");
}

TEST(HttpRequestTest, RoundTripsThroughText) {
    http::request req {"GET", "/a"};
    req.set_header("Host", "h");

    http::request parsed {std::string_view {req.to_string()}};
    EXPECT_EQ(parsed.get_path(), "/a");
    EXPECT_EQ(parsed.get_header("host"), "h");
}

TEST(HttpRequestTest, MalformedRequestsThrow) {
    http::request req;
    EXPECT_THROW(req.parse("GET /"), std::invalid_argument);
    EXPECT_THROW(req.parse("GET\r\n\r\n"), std::invalid_argument);
    EXPECT_THROW(req.parse("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n"), std::invalid_argument);
}

TEST(HttpResponseTest, ParsesContentLengthBody) {
    http::response res {std::string_view {
        "HTTP/1.1 200 OK\r\nContent-Type: text/xml\r\nContent-Length: 5\r\n\r\nhelloEXTRA"}};

    EXPECT_EQ(res.get_code(), 200);
    EXPECT_EQ(res.get_phrase(), "OK");
    EXPECT_EQ(res.get_header("content-type"), "text/xml");
    EXPECT_EQ(res.get_body(), "hello");
}

TEST(HttpResponseTest, BodyWithoutLengthRunsToEnd) {
    http::response res {std::string_view {"HTTP/1.0 200 OK\r\nServer: x\r\n\r\n<root/>"}};
    EXPECT_EQ(res.get_body(), "<root/>");
}

TEST(HttpResponseTest, DecodesChunkedBody) {
    http::response res {std::string_view {
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\n<roo\r\n"
        "3;ext=1\r\nt/>\r\n"
        "0\r\n\r\n"}};

    EXPECT_EQ(res.get_body(), "<root/>");
}

TEST(HttpResponseTest, ErrorStatusIsParsed) {
    http::response res {std::string_view {"HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\n\r\n"}};
    EXPECT_EQ(res.get_code(), 500);
    EXPECT_EQ(res.get_phrase(), "Internal Server Error");
    EXPECT_TRUE(res.get_body().empty());
}

TEST(HttpResponseTest, MalformedResponsesThrow) {
    http::response res;
    EXPECT_THROW(res.parse("garbage"), std::invalid_argument);
    EXPECT_THROW(res.parse("SIP/2.0 200 OK\r\n\r\n"), std::invalid_argument);
    EXPECT_THROW(res.parse("HTTP/1.1 abc OK\r\n\r\n"), std::invalid_argument);
    EXPECT_THROW(res.parse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort"), std::invalid_argument);
    EXPECT_THROW(res.parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nab"), std::invalid_argument);
}

TEST(HttpResponseTest, ToStringIsParseable) {
    http::response out;
    out.set_code(200);
    out.set_header("Content-Type", "text/xml");
    out.set_body(std::string {"<root/>"});

    http::response in {std::string_view {out.to_string()}};
    EXPECT_EQ(in.get_code(), 200);
    EXPECT_EQ(in.get_body(), "<root/>");
    EXPECT_EQ(in.get_header("Content-Length"), "7");
}

TEST(HttpResponseTest, CompletenessDetection) {
    EXPECT_FALSE(http::response_complete(""));
    EXPECT_FALSE(http::response_complete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n"));
    EXPECT_FALSE(http::response_complete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nab"));
    EXPECT_TRUE(http::response_complete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nabcd"));
    EXPECT_FALSE(http::response_complete("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nab\r\n"));
    EXPECT_TRUE(http::response_complete("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nab\r\n0\r\n\r\n"));
    // Without length information only the peer closing ends the response
    EXPECT_FALSE(http::response_complete("HTTP/1.0 200 OK\r\n\r\nbody"));
}
