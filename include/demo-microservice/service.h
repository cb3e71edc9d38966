#pragma once

#include "demo-microservice/config.h"
#include "demo-microservice/http.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace demo {

enum class HealthStatus : uint8_t {
  Up = 0,
  Down = 1,
};

std::string_view health_status_to_string(HealthStatus status);

struct GreetingResponse {
  std::string message;
  std::string version;
  int64_t timestamp = 0;

  [[nodiscard]] nlohmann::ordered_json to_json() const;
};

struct HealthResponse {
  HealthStatus status = HealthStatus::Up;
  std::string service;

  [[nodiscard]] nlohmann::ordered_json to_json() const;
};

// Milliseconds since the Unix epoch, read from the system clock.
int64_t epoch_millis();

class DemoService {
public:
  using Clock = std::function<int64_t()>;

  explicit DemoService(const Config& config, Clock clock = epoch_millis);

  [[nodiscard]] GreetingResponse greeting() const;
  [[nodiscard]] HealthResponse health() const;

  // Registers GET / and GET /health. The service must outlive the server.
  void register_routes(HttpServer& server) const;

private:
  std::string message_;
  std::string version_;
  std::string service_name_;
  Clock clock_;
};

} // namespace demo
