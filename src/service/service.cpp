#include "demo-microservice/service.h"

#include <chrono>
#include <utility>

namespace demo {

namespace {

HttpResponse json_ok(const nlohmann::ordered_json& body) {
  HttpResponse resp;
  resp.body = body.dump();
  resp.headers["Content-Type"] = "application/json";
  return resp;
}

} // namespace

std::string_view health_status_to_string(HealthStatus status) {
  switch (status) {
  case HealthStatus::Up:
    return "UP";
  case HealthStatus::Down:
    return "DOWN";
  }
  return "DOWN";
}

nlohmann::ordered_json GreetingResponse::to_json() const {
  nlohmann::ordered_json j;
  j["message"] = message;
  j["version"] = version;
  j["timestamp"] = timestamp;
  return j;
}

nlohmann::ordered_json HealthResponse::to_json() const {
  nlohmann::ordered_json j;
  j["status"] = std::string(health_status_to_string(status));
  j["service"] = service;
  return j;
}

int64_t epoch_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

DemoService::DemoService(const Config& config, Clock clock)
    : message_(config.greeting), version_(config.service_version),
      service_name_(config.service_name), clock_(std::move(clock)) {}

GreetingResponse DemoService::greeting() const {
  return GreetingResponse{message_, version_, clock_()};
}

HealthResponse DemoService::health() const {
  // Answering at all is the liveness signal; there is no dependency to report as DOWN.
  return HealthResponse{HealthStatus::Up, service_name_};
}

void DemoService::register_routes(HttpServer& server) const {
  server.route("GET", "/", [this](const HttpRequest&) {
    return json_ok(greeting().to_json());
  });

  server.route("GET", "/health", [this](const HttpRequest&) {
    return json_ok(health().to_json());
  });
}

} // namespace demo
