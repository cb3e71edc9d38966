#include "demo-microservice/config.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string_view>

namespace demo {

namespace {

constexpr std::string_view kVersion = "1.0.0";

constexpr int64_t kMaxWorkers = 256;

struct EnvBinding {
  const char* variable;
  std::string_view flag;
};

// DEMO_CONFIG is resolved separately since it decides which file to load.
constexpr EnvBinding kEnvBindings[] = {
    {"DEMO_ADDRESS", "--address"},   {"DEMO_PORT", "--port"},
    {"DEMO_GREETING", "--greeting"}, {"DEMO_PROFILE", "--profile"},
    {"DEMO_LOG_LEVEL", "--log-level"},
};

std::optional<int64_t> parse_integer(std::string_view text) {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

Result<void> set_port(Config& config, int64_t port) {
  if (port < 1 || port > 65535) {
    return Result<void>::failure(ErrorCode::InvalidArgument,
                                 "Port out of range: " + std::to_string(port));
  }
  config.port = static_cast<uint16_t>(port);
  return Result<void>::success();
}

Result<void> set_workers(Config& config, int64_t workers) {
  if (workers < 1 || workers > kMaxWorkers) {
    return Result<void>::failure(ErrorCode::InvalidArgument,
                                 "Worker count out of range: " + std::to_string(workers));
  }
  config.workers = static_cast<size_t>(workers);
  return Result<void>::success();
}

Result<void> set_log_level(Config& config, std::string_view name) {
  auto level = parse_log_level(name);
  if (!level) {
    return Result<void>::failure(level.error());
  }
  config.log_level = level.value();
  return Result<void>::success();
}

bool takes_value(std::string_view flag) {
  return flag == "--address" || flag == "--port" || flag == "--greeting" ||
         flag == "--service-version" || flag == "--service-name" || flag == "--profile" ||
         flag == "--log-level" || flag == "--workers" || flag == "--config";
}

// Shared by the environment and command line layers.
Result<void> apply_flag(Config& config, std::string_view flag, std::string_view value) {
  if (flag == "--address") {
    config.address = value;
  } else if (flag == "--greeting") {
    config.greeting = value;
  } else if (flag == "--service-version") {
    config.service_version = value;
  } else if (flag == "--service-name") {
    config.service_name = value;
  } else if (flag == "--profile") {
    config.profile = value;
  } else if (flag == "--config") {
    config.config_path = value;
  } else if (flag == "--log-level") {
    return set_log_level(config, value);
  } else if (flag == "--port" || flag == "--workers") {
    auto number = parse_integer(value);
    if (!number) {
      return Result<void>::failure(ErrorCode::InvalidArgument, "Invalid number for " +
                                                                   std::string(flag) + ": " +
                                                                   std::string(value));
    }
    return flag == "--port" ? set_port(config, *number) : set_workers(config, *number);
  } else {
    return Result<void>::failure(ErrorCode::InvalidArgument,
                                 "Unknown argument: " + std::string(flag));
  }
  return Result<void>::success();
}

} // namespace

Result<Config> ConfigParser::parse(int argc, char* argv[]) {
  Config config;

  if (const char* env_config = std::getenv("DEMO_CONFIG")) {
    config.config_path = env_config;
  }

  // First pass: only --config, so the file layer sits beneath env and argv.
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config.config_path = argv[++i];
    } else if (takes_value(arg)) {
      ++i;
    }
  }

  if (!config.config_path.empty()) {
    auto loaded = load_file(config.config_path, config);
    if (!loaded) {
      return Result<Config>::error(loaded.error());
    }
  }

  for (const auto& binding : kEnvBindings) {
    const char* value = std::getenv(binding.variable);
    if (value == nullptr || value[0] == '\0') {
      continue;
    }
    auto applied = apply_flag(config, binding.flag, value);
    if (!applied) {
      return Result<Config>::error(ErrorCode::InvalidArgument, std::string(binding.variable) +
                                                                   ": " +
                                                                   applied.error().message);
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--version" || arg == "-v") {
      config.show_version = true;
    } else if (takes_value(arg)) {
      if (i + 1 >= argc) {
        return Result<Config>::error(ErrorCode::InvalidArgument,
                                     "Missing value for " + std::string(arg));
      }
      auto applied = apply_flag(config, arg, argv[++i]);
      if (!applied) {
        return Result<Config>::error(applied.error());
      }
    } else {
      return Result<Config>::error(ErrorCode::InvalidArgument,
                                   "Unknown argument: " + std::string(arg));
    }
  }

  return Result<Config>::ok(std::move(config));
}

Result<void> ConfigParser::load_file(const std::string& path, Config& config) {
  std::ifstream file(path);
  if (!file) {
    return Result<void>::failure(ErrorCode::ConfigNotFound, "Config file not found: " + path);
  }

  nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return Result<void>::failure(ErrorCode::ConfigParseError,
                                 "Config file is not a JSON object: " + path);
  }

  try {
    if (doc.contains("address")) {
      config.address = doc.at("address").get<std::string>();
    }
    if (doc.contains("greeting")) {
      config.greeting = doc.at("greeting").get<std::string>();
    }
    if (doc.contains("version")) {
      config.service_version = doc.at("version").get<std::string>();
    }
    if (doc.contains("service_name")) {
      config.service_name = doc.at("service_name").get<std::string>();
    }
    if (doc.contains("profile")) {
      config.profile = doc.at("profile").get<std::string>();
    }
    if (doc.contains("log_level")) {
      auto applied = set_log_level(config, doc.at("log_level").get<std::string>());
      if (!applied) {
        return applied;
      }
    }
    for (const char* key : {"port", "workers"}) {
      if (!doc.contains(key)) {
        continue;
      }
      const auto& node = doc.at(key);
      if (!node.is_number_integer()) {
        return Result<void>::failure(ErrorCode::ConfigParseError,
                                     std::string("Config key '") + key + "' must be an integer");
      }
      auto value = node.get<int64_t>();
      auto applied = std::string_view(key) == "port" ? set_port(config, value)
                                                     : set_workers(config, value);
      if (!applied) {
        return applied;
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return Result<void>::failure(ErrorCode::ConfigParseError,
                                 "Config file " + path + ": " + e.what());
  }

  return Result<void>::success();
}

std::string_view ConfigParser::version() {
  return kVersion;
}

std::string ConfigParser::usage() {
  return "Usage: demo-microservice [OPTIONS]\n"
         "Options:\n"
         "  --address <addr>           Bind address (default 0.0.0.0)\n"
         "  --port <port>              Listen port (default 8080)\n"
         "  --greeting <text>          Message returned by GET /\n"
         "  --service-version <ver>    Version returned by GET /\n"
         "  --service-name <name>      Service name returned by GET /health\n"
         "  --profile <name>           Active runtime profile\n"
         "  --workers <n>              Worker threads (1-256)\n"
         "  --config <path>            JSON config file\n"
         "  --log-level <level>        Log level (debug, info, warn, error)\n"
         "  --version, -v              Show version\n"
         "  --help, -h                 Show this help\n";
}

} // namespace demo
