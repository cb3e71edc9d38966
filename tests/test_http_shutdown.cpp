#include "demo-microservice/http.h"
#include "test_utils.h"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace demo {

TEST(HttpServerShutdown, StopsWhenRunningFlagClears) {
    volatile std::sig_atomic_t running = 1;
    HttpServer server("127.0.0.1", 0);
    server.route("GET", "/health", [](const HttpRequest&) {
        HttpResponse resp;
        resp.body = "{}";
        return resp;
    });
    ASSERT_TRUE(server.bind().ok());

    std::thread server_thread([&]() {
        server.serve_forever(&running);
    });

    auto resp = test_support::http_request(server.port(), "GET", "/health");
    EXPECT_EQ(resp.status, 200);

    running = 0;

    // Hangs here if the accept loop does not observe the flag.
    server_thread.join();
    SUCCEED();
}

TEST(HttpServerShutdown, StopFromAnotherThread) {
    HttpServer server("127.0.0.1", 0, 2);
    ASSERT_TRUE(server.bind().ok());

    std::atomic<bool> returned{false};
    auto served = Result<void>::failure(ErrorCode::Unknown, "not returned");
    std::thread server_thread([&]() {
        served = server.serve_forever();
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned.load());

    auto start = std::chrono::steady_clock::now();
    server.stop();
    server_thread.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(returned.load());
    EXPECT_TRUE(served.ok());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(HttpServerShutdown, StopBeforeServeReturnsImmediately) {
    HttpServer server("127.0.0.1", 0);
    ASSERT_TRUE(server.bind().ok());
    server.stop();
    EXPECT_TRUE(server.serve_forever().ok());
}

TEST(HttpServerShutdown, ServeWithoutBindReturnsBindFailure) {
    HttpServer server("999.0.0.1", 0, 1);
    auto served = server.serve_forever();
    ASSERT_FALSE(served.ok());
    EXPECT_EQ(served.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(served.error().message, "Invalid bind address: 999.0.0.1");
}

} // namespace demo
