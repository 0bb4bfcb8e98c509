/**
 * Unit tests for HttpServer
 *
 * Request parsing, response building and route dispatch, without sockets.
 */

#include <gtest/gtest.h>
#include "../../src/http_server.h"
#include "../../src/constants.h"
#include <stdexcept>

using namespace liverun;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    HttpRequest create_request(const std::string& method, const std::string& path) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.client_ip = "127.0.0.1";
        return req;
    }

    static HttpResponse text_response(const std::string& body) {
        HttpResponse resp;
        resp.body = body;
        return resp;
    }

    HttpServer server{0};
};

// ============================================================================
// Request parsing
// ============================================================================

TEST_F(HttpServerTest, ParsesGetRequest) {
    // Given: A plain GET
    std::string raw =
        "GET /health HTTP/1.1\r\n"
        "Host: localhost:5000\r\n"
        "User-Agent: curl/8.0\r\n"
        "\r\n";

    // When: Parsed
    HttpRequest req = HttpServer::parse_request(raw);

    // Then: Method, path and headers are extracted
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/health");
    EXPECT_EQ(req.headers["Host"], "localhost:5000");
    EXPECT_EQ(req.headers["User-Agent"], "curl/8.0");
    EXPECT_TRUE(req.body.empty());
}

TEST_F(HttpServerTest, ParsesPostBody) {
    std::string body = "{\"code\":\"print('a\\r\\n\\r\\nb')\"}";
    std::string raw =
        "POST /run_code HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;

    HttpRequest req = HttpServer::parse_request(raw);

    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/run_code");
    EXPECT_EQ(req.body, body);
}

TEST_F(HttpServerTest, BodyMayContainBlankLines) {
    std::string raw = "POST /x HTTP/1.1\r\nContent-Length: 8\r\n\r\na\r\n\r\nb\r\n";

    HttpRequest req = HttpServer::parse_request(raw);

    EXPECT_EQ(req.body, "a\r\n\r\nb\r\n");
}

TEST_F(HttpServerTest, SplitsQueryString) {
    HttpRequest req = HttpServer::parse_request(
        "GET /channel/room-1?token=abc&x=1 HTTP/1.1\r\nHost: h\r\n\r\n");

    EXPECT_EQ(req.path, "/channel/room-1");
    EXPECT_EQ(req.query, "token=abc&x=1");
}

TEST_F(HttpServerTest, HeaderLookupIgnoresCase) {
    HttpRequest req = HttpServer::parse_request(
        "GET / HTTP/1.1\r\ncontent-length: 12\r\nSec-WebSocket-Key: k==\r\n\r\n");

    EXPECT_EQ(req.header("Content-Length"), "12");
    EXPECT_EQ(req.header("sec-websocket-key"), "k==");
    EXPECT_EQ(req.header("Missing"), "");
}

TEST_F(HttpServerTest, MalformedRequestLineLeavesFieldsEmpty) {
    HttpRequest req = HttpServer::parse_request("GARBAGE\r\n\r\n");

    EXPECT_TRUE(req.method.empty());
    EXPECT_TRUE(req.path.empty());
}

// ============================================================================
// Response building
// ============================================================================

TEST_F(HttpServerTest, BuildsResponseWithLengthAndCors) {
    // Given: A JSON response
    HttpResponse resp = text_response("{\"status\":\"ok\"}");

    // When: Serialized
    std::string wire = HttpServer::build_response(resp);

    // Then: Status line, default headers and exact length are present
    EXPECT_EQ(wire.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Access-Control-Allow-Origin: *\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 15\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 15), "{\"status\":\"ok\"}");
}

TEST_F(HttpServerTest, ReasonPhrases) {
    EXPECT_EQ(HttpServer::reason_phrase(101), "Switching Protocols");
    EXPECT_EQ(HttpServer::reason_phrase(404), "Not Found");
    EXPECT_EQ(HttpServer::reason_phrase(413), "Payload Too Large");
    EXPECT_EQ(HttpServer::reason_phrase(599), "Unknown");
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(HttpServerTest, ExactRouteMatch) {
    server.route("POST", "/run_code", [](const HttpRequest& req) {
        return text_response("ran " + req.body);
    });

    HttpRequest req = create_request("POST", "/run_code");
    req.body = "x";

    HttpResponse resp = server.dispatch(req);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "ran x");
}

TEST_F(HttpServerTest, MethodMustMatch) {
    server.route("POST", "/run_code", [](const HttpRequest&) { return text_response("ok"); });

    EXPECT_EQ(server.dispatch(create_request("GET", "/run_code")).status_code, 404);
}

TEST_F(HttpServerTest, UnknownPathIs404Json) {
    HttpResponse resp = server.dispatch(create_request("GET", "/nowhere"));

    EXPECT_EQ(resp.status_code, 404);
    EXPECT_NE(resp.body.find("\"error\""), std::string::npos);
}

TEST_F(HttpServerTest, LongestPrefixRouteWins) {
    // Given: Nested prefix routes and a root route
    server.route("GET", "/", [](const HttpRequest&) { return text_response("root"); });
    server.route("GET", "/api/", [](const HttpRequest&) { return text_response("api"); });
    server.route("GET", "/api/executions/", [](const HttpRequest&) { return text_response("exec"); });

    // Then: The most specific prefix handles each path
    EXPECT_EQ(server.dispatch(create_request("GET", "/api/executions/42")).body, "exec");
    EXPECT_EQ(server.dispatch(create_request("GET", "/api/other")).body, "api");
    EXPECT_EQ(server.dispatch(create_request("GET", "/")).body, "root");

    // And: "/" is exact only
    EXPECT_EQ(server.dispatch(create_request("GET", "/elsewhere")).status_code, 404);
}

TEST_F(HttpServerTest, ThrowingHandlerIs500) {
    server.route("GET", "/boom", [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("handler exploded");
    });

    HttpResponse resp = server.dispatch(create_request("GET", "/boom"));

    EXPECT_EQ(resp.status_code, 500);
    EXPECT_NE(resp.body.find("handler exploded"), std::string::npos);
}

TEST_F(HttpServerTest, ListenOnAnyPortReportsBoundPort) {
    int port = server.listen();

    EXPECT_GT(port, 0);
    EXPECT_EQ(server.port(), port);
    server.stop();
}
