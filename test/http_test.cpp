#include <gtest/gtest.h>

#include "http.hpp"

TEST(HttpParseTest, ParsesRequestLineAndHeaders)
{
    auto request = Http::parseRequest("GET /users/42?tab=posts&x=a+b HTTP/1.1\r\n"
                                      "Host: example.com\r\n"
                                      "Accept-Encoding: gzip, deflate\r\n"
                                      "X-Multi: one\r\n"
                                      "x-multi: two");
    ASSERT_TRUE(request);
    EXPECT_EQ(request->method, "GET");
    EXPECT_EQ(request->target, "/users/42?tab=posts&x=a+b");
    EXPECT_EQ(request->path, "/users/42");
    EXPECT_EQ(request->version, "HTTP/1.1");
    EXPECT_EQ(request->query.at("tab"), "posts");
    EXPECT_EQ(request->query.at("x"), "a b");
    EXPECT_EQ(request->header("host"), "example.com");
    EXPECT_EQ(request->header("x-multi"), "one, two");
    EXPECT_EQ(request->header("absent"), "");
}

TEST(HttpParseTest, PathIsPercentDecoded)
{
    auto request = Http::parseRequest("GET /caf%C3%A9/a+b HTTP/1.1");
    ASSERT_TRUE(request);
    EXPECT_EQ(request->path, "/café/a+b");
}

TEST(HttpParseTest, RejectsMalformedRequests)
{
    EXPECT_FALSE(Http::parseRequest(""));
    EXPECT_FALSE(Http::parseRequest("GET /"));
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/2.0"));
    EXPECT_FALSE(Http::parseRequest("GET relative HTTP/1.1"));
    EXPECT_FALSE(Http::parseRequest("GET /%zz HTTP/1.1"));
    EXPECT_FALSE(Http::parseRequest("G(T / HTTP/1.1"));
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1\r\nno colon here"));
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1\r\nContent-Length: abc"));
}

TEST(HttpParseTest, PercentDecode)
{
    EXPECT_EQ(Http::percentDecode("a%20b"), "a b");
    EXPECT_EQ(Http::percentDecode("a+b"), "a+b");
    EXPECT_EQ(Http::percentDecode("a+b", true), "a b");
    EXPECT_FALSE(Http::percentDecode("%4"));
    EXPECT_FALSE(Http::percentDecode("%G0"));
}

TEST(HttpRequestTest, KeepAliveRules)
{
    EXPECT_TRUE(Http::parseRequest("GET / HTTP/1.1")->keepAlive());
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1\r\nConnection: close")->keepAlive());
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.0")->keepAlive());
    EXPECT_TRUE(Http::parseRequest("GET / HTTP/1.0\r\nConnection: Keep-Alive")->keepAlive());
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1\r\nContent-Length: 5")->keepAlive());
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1\r\nTransfer-Encoding: chunked")->keepAlive());
}

TEST(HttpRequestTest, AcceptsGzip)
{
    EXPECT_TRUE(Http::parseRequest("GET / HTTP/1.1\r\nAccept-Encoding: br, gzip")->acceptsGzip());
    EXPECT_TRUE(Http::parseRequest("GET / HTTP/1.1\r\nAccept-Encoding: *")->acceptsGzip());
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1\r\nAccept-Encoding: gzip;q=0")->acceptsGzip());
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1\r\nAccept-Encoding: br")->acceptsGzip());
    EXPECT_FALSE(Http::parseRequest("GET / HTTP/1.1")->acceptsGzip());
}

TEST(HttpResponseTest, StatusTextAndErrorResponse)
{
    EXPECT_EQ(Http::statusText(200), "OK");
    EXPECT_EQ(Http::statusText(404), "Not Found");
    EXPECT_EQ(Http::statusText(431), "Request Header Fields Too Large");

    HttpResponse response = Http::errorResponse(405);
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(response.body, "Method Not Allowed");
    EXPECT_EQ(response.contentType, "text/plain; charset=utf-8");
}

TEST(HttpResponseTest, GeneratesHeaders)
{
    HttpResponse response;
    response.contentType = "text/html";
    response.headers.emplace_back("Vary", "HX-Request");

    std::string head = Http::generateHeaders(response, 12, "gzip", true);
    EXPECT_TRUE(head.starts_with("HTTP/1.1 200 OK\r\n")) << head;
    EXPECT_NE(head.find("Content-Type: text/html\r\n"), std::string::npos) << head;
    EXPECT_NE(head.find("Content-Length: 12\r\n"), std::string::npos) << head;
    EXPECT_NE(head.find("Content-Encoding: gzip\r\n"), std::string::npos) << head;
    EXPECT_NE(head.find("Connection: keep-alive\r\n"), std::string::npos) << head;
    EXPECT_NE(head.find("X-Content-Type-Options: nosniff\r\n"), std::string::npos) << head;
    EXPECT_NE(head.find("Vary: HX-Request\r\n"), std::string::npos) << head;
    EXPECT_NE(head.find("Date: "), std::string::npos) << head;
    EXPECT_TRUE(head.ends_with("\r\n\r\n")) << head;

    std::string closing = Http::generateHeaders(Http::errorResponse(404), 9, "", false);
    EXPECT_NE(closing.find("Connection: close\r\n"), std::string::npos) << closing;
    EXPECT_EQ(closing.find("Content-Encoding"), std::string::npos) << closing;
}

TEST(HttpSendTest, WritesHeadersAndBodyToSocket)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    HttpResponse response;
    response.contentType = "text/plain";
    response.body = "hello";
    size_t sent = Http::sendResponse(fds[0], response, "-", false);
    close(fds[0]);

    std::string received;
    char buffer[4096];
    ssize_t n;
    while ((n = read(fds[1], buffer, sizeof(buffer))) > 0)
        received.append(buffer, static_cast<size_t>(n));
    close(fds[1]);

    EXPECT_EQ(sent, received.size());
    EXPECT_TRUE(received.starts_with("HTTP/1.1 200 OK\r\n"));
    EXPECT_TRUE(received.ends_with("\r\n\r\nhello"));
}
