#pragma once

#include "demo-microservice/logger.h"
#include "demo-microservice/result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace demo {

inline constexpr std::string_view kDefaultGreeting =
    "Hello from Microservice! New message here hihi!";
inline constexpr std::string_view kDefaultServiceName = "demo-microservice";
inline constexpr std::string_view kDefaultServiceVersion = "1.0.0";
inline constexpr uint16_t kDefaultPort = 8080;

struct Config {
  std::string address = "0.0.0.0";
  uint16_t port = kDefaultPort;
  std::string greeting{kDefaultGreeting};
  std::string service_version{kDefaultServiceVersion};
  std::string service_name{kDefaultServiceName};
  std::string profile = "default";
  LogLevel log_level = LogLevel::Info;
  size_t workers = 4;
  std::string config_path;
  bool show_version = false;
  bool show_help = false;
};

struct ConfigParser {
  // Layers, lowest precedence first: defaults, config file, environment, argv.
  static Result<Config> parse(int argc, char* argv[]);

  // Overlays the keys present in a JSON config file onto config.
  static Result<void> load_file(const std::string& path, Config& config);

  static std::string_view version();
  static std::string usage();
};

} // namespace demo
