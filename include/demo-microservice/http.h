#pragma once

#include "demo-microservice/logger.h"
#include "demo-microservice/result.h"

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace demo {

// Views point into the buffer handed to parse_request, which must outlive the request.
struct HttpRequest {
  std::string_view method;
  std::string_view path;
  std::string_view query;
  std::string_view body;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  uint16_t status_code = 200;
  std::string_view status_text = "OK";
  std::string body;
  std::map<std::string, std::string> headers;
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// Builds a response carrying {"error": reason}.
HttpResponse error_response(uint16_t status_code, std::string_view status_text,
                            std::string_view reason);

class HttpServer {
public:
  static constexpr size_t kMaxRequestSize = 1024 * 1024;
  static constexpr size_t kMaxPendingConnections = 256;
  // Budget for reading one whole request, measured from when a worker picks it up.
  static constexpr int kRequestTimeoutSeconds = 5;
  static constexpr int kPollIntervalMs = 100;

  HttpServer(std::string_view address, uint16_t port, size_t workers = 4,
             Logger* logger = nullptr);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Exact-match routing on path; the same path may be registered for several methods.
  void route(std::string_view method, std::string_view path, RequestHandler handler);

  Result<void> bind();

  // Connections beyond this many waiting for a worker are answered 503.
  void set_max_pending_connections(size_t max_pending);

  // Accepts until *running_flag becomes 0 or stop() is called. Binds first if needed.
  // Connections already accepted are served before the workers are joined.
  // Fails only when binding fails or the listening socket becomes unusable.
  Result<void> serve_forever(volatile std::sig_atomic_t* running_flag = nullptr);
  void stop();

  // The bound port once bind() succeeded, so port 0 resolves to the OS choice.
  [[nodiscard]] uint16_t port() const noexcept { return port_; }
  [[nodiscard]] const std::string& address() const noexcept { return address_; }

  HttpResponse dispatch(const HttpRequest& req) const;

  static HttpRequest parse_request(const std::string& data);
  static std::string format_response(const HttpResponse& resp);

private:
  struct Route {
    std::string method;
    std::string path;
    RequestHandler handler;
  };

  void worker_loop();
  void handle_client(int client_fd);
  void send_all(int client_fd, const std::string& data) const;

  std::string address_;
  uint16_t port_;
  size_t worker_count_;
  size_t max_pending_ = kMaxPendingConnections;
  Logger* logger_;
  int server_fd_ = -1;
  std::atomic<bool> stop_requested_{false};
  std::vector<Route> routes_;

  std::vector<std::thread> workers_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::queue<int> pending_;
};

} // namespace demo
