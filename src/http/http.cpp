#include "demo-microservice/http.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <exception>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <strings.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv[0] == ' ' || sv[0] == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() &&
         (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\n' || sv.back() == '\r')) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Scans a header block (without the terminating blank line) for Content-Length.
// A missing or unparseable value counts as no body.
size_t find_content_length(std::string_view headers) {
  constexpr std::string_view kName = "Content-Length:";
  size_t pos = 0;
  while (pos < headers.size()) {
    size_t line_end = headers.find("\r\n", pos);
    if (line_end == std::string_view::npos) {
      line_end = headers.size();
    }
    std::string_view line = headers.substr(pos, line_end - pos);
    if (line.size() >= kName.size() &&
        strncasecmp(line.data(), kName.data(), kName.size()) == 0) {
      std::string_view value = trim(line.substr(kName.size()));
      size_t length = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return 0;
      }
      return length;
    }
    pos = line_end + 2;
  }
  return 0;
}

// Descriptor or buffer exhaustion; the listener itself is still healthy.
bool is_transient_accept_error(int err) {
  return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
}

} // namespace

namespace demo {

HttpResponse error_response(uint16_t status_code, std::string_view status_text,
                            std::string_view reason) {
  HttpResponse resp;
  resp.status_code = status_code;
  resp.status_text = status_text;
  resp.body = nlohmann::json{{"error", std::string(reason)}}.dump();
  resp.headers["Content-Type"] = "application/json";
  return resp;
}

HttpServer::HttpServer(std::string_view address, uint16_t port, size_t workers, Logger* logger)
    : address_(address), port_(port), worker_count_(std::max<size_t>(workers, 1)),
      logger_(logger) {}

HttpServer::~HttpServer() {
  stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  while (!pending_.empty()) {
    close(pending_.front());
    pending_.pop();
  }
  if (server_fd_ >= 0) {
    close(server_fd_);
  }
}

void HttpServer::set_max_pending_connections(size_t max_pending) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  max_pending_ = std::max<size_t>(max_pending, 1);
}

void HttpServer::route(std::string_view method, std::string_view path, RequestHandler handler) {
  routes_.push_back(Route{std::string(method), std::string(path), std::move(handler)});
}

Result<void> HttpServer::bind() {
  if (server_fd_ >= 0) {
    return Result<void>::success();
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (inet_pton(AF_INET, address_.c_str(), &addr.sin_addr) != 1) {
    return Result<void>::failure(ErrorCode::InvalidArgument, "Invalid bind address: " + address_);
  }

  server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    return Result<void>::failure(ErrorCode::SocketError,
                                 std::string("socket failed: ") + strerror(errno));
  }

  int opt = 1;
  setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (::bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    close(server_fd_);
    server_fd_ = -1;
    return Result<void>::failure(ErrorCode::BindError, "bind " + address_ + ":" +
                                                           std::to_string(port_) +
                                                           " failed: " + strerror(err));
  }

  if (listen(server_fd_, SOMAXCONN) < 0) {
    int err = errno;
    close(server_fd_);
    server_fd_ = -1;
    return Result<void>::failure(ErrorCode::BindError,
                                 std::string("listen failed: ") + strerror(err));
  }

  socklen_t len = sizeof(addr);
  if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }

  return Result<void>::success();
}

Result<void> HttpServer::serve_forever(volatile std::sig_atomic_t* running_flag) {
  if (server_fd_ < 0) {
    auto bound = bind();
    if (!bound) {
      return bound;
    }
  }

  workers_.reserve(worker_count_);
  for (size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }

  auto outcome = Result<void>::success();
  while (!stop_requested_.load() && (running_flag == nullptr || *running_flag)) {
    struct pollfd pfd = {server_fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      outcome = Result<void>::failure(ErrorCode::SocketError,
                                      std::string("poll failed: ") + strerror(errno));
      break;
    }
    if (ready == 0) {
      continue;
    }

    int client_fd = accept(server_fd_, nullptr, nullptr);
    if (client_fd < 0) {
      int err = errno;
      if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK || err == ECONNABORTED) {
        continue;
      }
      if (is_transient_accept_error(err)) {
        // The pending connection keeps the listener readable, so back off before polling again.
        if (logger_ != nullptr) {
          logger_->warn(std::string("accept failed, retrying: ") + strerror(err));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        continue;
      }
      outcome = Result<void>::failure(ErrorCode::SocketError,
                                      std::string("accept failed: ") + strerror(err));
      break;
    }

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (pending_.size() < max_pending_) {
        pending_.push(client_fd);
        client_fd = -1;
      }
    }

    if (client_fd >= 0) {
      send_all(client_fd,
               format_response(error_response(503, "Service Unavailable", "server busy")));
      close(client_fd);
      continue;
    }
    queue_cv_.notify_one();
  }

  stop();
  for (auto& worker : workers_) {
    worker.join();
  }
  workers_.clear();
  return outcome;
}

void HttpServer::stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stop_requested_.store(true);
  }
  queue_cv_.notify_all();
}

void HttpServer::worker_loop() {
  while (true) {
    int client_fd = -1;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return stop_requested_.load() || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      client_fd = pending_.front();
      pending_.pop();
    }
    handle_client(client_fd);
    close(client_fd);
  }
}

void HttpServer::handle_client(int client_fd) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(kRequestTimeoutSeconds);

  std::string request_buffer;
  char temp_buf[4096];
  size_t body_start = std::string::npos;
  size_t content_length = 0;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      // An idle connection is dropped silently; a partial request is told why.
      if (!request_buffer.empty()) {
        send_all(client_fd,
                 format_response(error_response(408, "Request Timeout", "request timeout")));
      }
      return;
    }

    struct pollfd pfd = {client_fd, POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = read(client_fd, temp_buf, sizeof(temp_buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    request_buffer.append(temp_buf, static_cast<size_t>(n));

    if (body_start == std::string::npos) {
      size_t header_end = request_buffer.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        body_start = header_end + 4;
        content_length =
            find_content_length(std::string_view(request_buffer).substr(0, header_end));
      }
    }

    if (request_buffer.size() > kMaxRequestSize ||
        (body_start != std::string::npos && content_length > kMaxRequestSize - body_start)) {
      send_all(client_fd,
               format_response(error_response(413, "Payload Too Large", "payload too large")));
      return;
    }

    if (body_start != std::string::npos && request_buffer.size() >= body_start + content_length) {
      break;
    }
  }

  if (request_buffer.empty()) {
    return;
  }

  // A request cut short by EOF fails to parse and gets a 400.
  HttpRequest req = parse_request(request_buffer);
  send_all(client_fd, format_response(dispatch(req)));
}

void HttpServer::send_all(int client_fd, const std::string& data) const {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (logger_ != nullptr) {
        logger_->debug(std::string("send failed: ") + strerror(errno));
      }
      return;
    }
    sent += static_cast<size_t>(n);
  }
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
  HttpResponse resp;

  if (req.method.empty()) {
    resp = error_response(400, "Bad Request", "bad request");
  } else {
    const Route* match = nullptr;
    std::string allowed;
    for (const auto& route : routes_) {
      if (route.path != req.path) {
        continue;
      }
      if (route.method == req.method) {
        match = &route;
        break;
      }
      if (!allowed.empty()) {
        allowed += ", ";
      }
      allowed += route.method;
    }

    if (match != nullptr) {
      try {
        resp = match->handler(req);
      } catch (const std::exception& e) {
        if (logger_ != nullptr) {
          logger_->error("handler for " + std::string(req.path) + " threw: " + e.what());
        }
        resp = error_response(500, "Internal Server Error", "internal error");
      }
    } else if (!allowed.empty()) {
      resp = error_response(405, "Method Not Allowed", "method not allowed");
      resp.headers["Allow"] = allowed;
    } else {
      resp = error_response(404, "Not Found", "not found");
    }
  }

  if (resp.headers.find("Content-Type") == resp.headers.end()) {
    resp.headers["Content-Type"] = "application/json";
  }

  if (logger_ != nullptr && logger_->enabled(LogLevel::Debug)) {
    std::string_view method = req.method.empty() ? std::string_view("-") : req.method;
    std::string_view path = req.path.empty() ? std::string_view("-") : req.path;
    logger_->debug(std::string(method) + " " + std::string(path) + " " +
                   std::to_string(resp.status_code));
  }

  return resp;
}

HttpRequest HttpServer::parse_request(const std::string& data) {
  HttpRequest req;
  std::string_view view(data);

  size_t header_end = view.find("\r\n\r\n");
  if (header_end == std::string_view::npos) {
    return req;
  }

  size_t line_end = view.find("\r\n");
  std::string_view request_line = view.substr(0, line_end);
  size_t sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos) {
    return req;
  }
  size_t sp2 = request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos) {
    return req;
  }

  std::string_view method = request_line.substr(0, sp1);
  std::string_view target = trim(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
  std::string_view version = trim(request_line.substr(sp2 + 1));
  if (method.empty() || target.empty() || !version.starts_with("HTTP/")) {
    return req;
  }

  req.method = method;
  size_t query_start = target.find('?');
  if (query_start == std::string_view::npos) {
    req.path = target;
  } else {
    req.path = target.substr(0, query_start);
    req.query = target.substr(query_start + 1);
  }

  size_t pos = line_end + 2;
  while (pos < header_end) {
    size_t eol = view.find("\r\n", pos);
    std::string_view line = view.substr(pos, eol - pos);
    pos = eol + 2;

    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    std::string_view name = trim(line.substr(0, colon));
    if (name.empty()) {
      continue;
    }
    req.headers[std::string(name)] = std::string(trim(line.substr(colon + 1)));
  }

  size_t body_start = header_end + 4;
  size_t content_length = find_content_length(view.substr(0, header_end));
  req.body = view.substr(body_start, std::min(content_length, view.size() - body_start));
  return req;
}

std::string HttpServer::format_response(const HttpResponse& resp) {
  std::string resp_str = "HTTP/1.1 ";
  resp_str += std::to_string(resp.status_code) + " " + std::string(resp.status_text) + "\r\n";

  for (const auto& [key, value] : resp.headers) {
    resp_str += key + ": " + value + "\r\n";
  }

  resp_str += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
  resp_str += "Connection: close\r\n";
  resp_str += "\r\n";
  resp_str += resp.body;

  return resp_str;
}

} // namespace demo
