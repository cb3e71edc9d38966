#include <gtest/gtest.h>
#include "demo-microservice/http.h"
#include "demo-microservice/logger.h"

#include <sstream>
#include <stdexcept>

using namespace demo;

namespace {

HttpResponse text_handler(const HttpRequest& req) {
    HttpResponse resp;
    resp.body = std::string(req.method) + " ok";
    resp.headers["Content-Type"] = "text/plain";
    return resp;
}

} // namespace

class HttpDispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.route("GET", "/items", text_handler);
        server.route("PUT", "/items", text_handler);
        server.route("GET", "/raw", [](const HttpRequest&) {
            HttpResponse resp;
            resp.body = "{}";
            return resp;
        });
    }

    HttpResponse dispatch(const std::string& raw) {
        data_ = raw;
        return server.dispatch(HttpServer::parse_request(data_));
    }

    HttpServer server{"127.0.0.1", 0};

private:
    std::string data_;
};

TEST(HttpFormatTest, FormatResponse_Simple) {
    HttpResponse resp;
    resp.status_code = 200;
    resp.status_text = "OK";
    resp.body = "hello";
    resp.headers["Content-Type"] = "text/plain";

    std::string s = HttpServer::format_response(resp);

    EXPECT_EQ(s.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(s.find("Content-Type: text/plain\r\n"), std::string::npos);
    EXPECT_NE(s.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_NE(s.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(s.find("\r\n\r\nhello"), std::string::npos);
}

TEST(HttpFormatTest, FormatResponse_EmptyBody) {
    HttpResponse resp;
    resp.status_code = 404;
    resp.status_text = "Not Found";

    std::string s = HttpServer::format_response(resp);

    EXPECT_NE(s.find("HTTP/1.1 404 Not Found\r\n"), std::string::npos);
    EXPECT_NE(s.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_EQ(s.substr(s.size() - 4), "\r\n\r\n");
}

TEST(HttpFormatTest, ErrorResponseCarriesJsonReason) {
    HttpResponse resp = error_response(405, "Method Not Allowed", "method not allowed");
    EXPECT_EQ(resp.status_code, 405);
    EXPECT_EQ(resp.status_text, "Method Not Allowed");
    EXPECT_EQ(resp.body, R"({"error":"method not allowed"})");
    EXPECT_EQ(resp.headers["Content-Type"], "application/json");
}

TEST_F(HttpDispatchTest, RoutesByMethodAndPath) {
    HttpResponse resp = dispatch("PUT /items HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "PUT ok");
    EXPECT_EQ(resp.headers["Content-Type"], "text/plain");
}

TEST_F(HttpDispatchTest, QueryStringDoesNotAffectRouting) {
    HttpResponse resp = dispatch("GET /items?page=2 HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "GET ok");
}

TEST_F(HttpDispatchTest, DefaultsContentTypeToJson) {
    HttpResponse resp = dispatch("GET /raw HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.headers["Content-Type"], "application/json");
}

TEST_F(HttpDispatchTest, UnknownPathIs404) {
    HttpResponse resp = dispatch("GET /missing HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_EQ(resp.body, R"({"error":"not found"})");
}

TEST_F(HttpDispatchTest, WrongMethodIs405WithAllowHeader) {
    HttpResponse resp = dispatch("DELETE /items HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.status_code, 405);
    EXPECT_EQ(resp.headers["Allow"], "GET, PUT");
}

TEST_F(HttpDispatchTest, MethodMatchIsCaseSensitive) {
    HttpResponse resp = dispatch("get /items HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.status_code, 405);
}

TEST_F(HttpDispatchTest, MalformedRequestIs400) {
    HttpResponse resp = dispatch("garbage\r\n\r\n");
    EXPECT_EQ(resp.status_code, 400);
    EXPECT_EQ(resp.body, R"({"error":"bad request"})");
}

TEST(HttpDispatchLogging, ThrowingHandlerIs500AndLogged) {
    std::stringstream log;
    Logger logger(log);
    HttpServer server("127.0.0.1", 0, 1, &logger);
    server.route("GET", "/boom", [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("kaboom");
    });

    std::string data = "GET /boom HTTP/1.1\r\n\r\n";
    HttpResponse resp = server.dispatch(HttpServer::parse_request(data));

    EXPECT_EQ(resp.status_code, 500);
    EXPECT_NE(log.str().find("[ERROR] handler for /boom threw: kaboom"), std::string::npos);
}

TEST(HttpDispatchLogging, AccessLineAtDebugLevel) {
    std::stringstream log;
    Logger logger(log, LogLevel::Debug);
    HttpServer server("127.0.0.1", 0, 1, &logger);
    server.route("GET", "/health", text_handler);

    std::string ok = "GET /health HTTP/1.1\r\n\r\n";
    std::string missing = "GET /nope HTTP/1.1\r\n\r\n";
    server.dispatch(HttpServer::parse_request(ok));
    server.dispatch(HttpServer::parse_request(missing));

    EXPECT_NE(log.str().find("[DEBUG] GET /health 200"), std::string::npos);
    EXPECT_NE(log.str().find("[DEBUG] GET /nope 404"), std::string::npos);
}

TEST(HttpDispatchLogging, AccessLineSuppressedAtInfoLevel) {
    std::stringstream log;
    Logger logger(log, LogLevel::Info);
    HttpServer server("127.0.0.1", 0, 1, &logger);
    server.route("GET", "/health", text_handler);

    std::string ok = "GET /health HTTP/1.1\r\n\r\n";
    server.dispatch(HttpServer::parse_request(ok));

    EXPECT_TRUE(log.str().empty());
}

TEST(HttpBindTest, PortZeroResolvesToAssignedPort) {
    HttpServer server("127.0.0.1", 0);
    auto bound = server.bind();
    ASSERT_TRUE(bound.ok());
    EXPECT_NE(server.port(), 0);
}

TEST(HttpBindTest, InvalidAddressIsRejected) {
    HttpServer server("not-an-address", 0);
    auto bound = server.bind();
    ASSERT_FALSE(bound.ok());
    EXPECT_EQ(bound.error().code, ErrorCode::InvalidArgument);
}

TEST(HttpBindTest, PortInUseIsBindError) {
    HttpServer first("127.0.0.1", 0);
    ASSERT_TRUE(first.bind().ok());

    HttpServer second("127.0.0.1", first.port());
    auto bound = second.bind();
    ASSERT_FALSE(bound.ok());
    EXPECT_EQ(bound.error().code, ErrorCode::BindError);
}
