// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <algorithm>
#include <array>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <vector>

namespace ircguard {
namespace util {

namespace {

constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
constexpr const char *DEFAULT_LOGGER = "default";

// 10 MB per file, 3 files
constexpr size_t LOG_FILE_MAX_SIZE = 10 * 1024 * 1024;
constexpr size_t LOG_FILE_MAX_FILES = 3;

const std::array<const char *, 4> COMPONENTS = {DEFAULT_LOGGER, "network", "relay", "app"};

std::once_flag g_init_flag;

// Guards g_loggers. Never call GetLogger() or a LOG_ macro while holding it.
std::mutex g_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

// Rotating file sink, or nullptr (with a note on stderr) if it cannot be opened
spdlog::sink_ptr MakeFileSink(const std::string &path) {
  namespace fs = std::filesystem;
  fs::path file = path.empty() ? fs::path("ircguard.log") : fs::path(path);

  if (file.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
      std::cerr << "Cannot create log directory " << file.parent_path().string() << ": "
                << ec.message() << "\n";
    }
  }

  try {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file.string(), LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES);
    sink->set_pattern(LOG_PATTERN);
    return sink;
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Cannot open log file " << file.string() << " (" << ex.what()
              << "), logging to console only\n";
    return nullptr;
  }
}

void InitializeOnce(const std::string &log_level, bool log_to_file,
                    const std::string &log_file_path) {
  try {
    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(LOG_PATTERN);
    sinks.push_back(console);
    if (log_to_file) {
      if (auto file = MakeFileSink(log_file_path)) {
        sinks.push_back(file);
      }
    }

    const auto level = spdlog::level::from_str(log_level);
    std::shared_ptr<spdlog::logger> default_logger;
    {
      std::lock_guard<std::mutex> lock(g_loggers_mutex);
      for (const char *name : COMPONENTS) {
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::trace);
        spdlog::register_logger(logger);
        g_loggers[name] = logger;
      }
      default_logger = g_loggers[DEFAULT_LOGGER];
    }

    spdlog::set_default_logger(default_logger);
    if (level != spdlog::level::off) {
      default_logger->info("Logging initialized (level: {})", log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

// Logger that swallows everything, handed out after Shutdown() or a failed init
std::shared_ptr<spdlog::logger> SilentLogger() {
  auto logger = std::make_shared<spdlog::logger>(
      DEFAULT_LOGGER, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  logger->set_level(spdlog::level::off);
  return logger;
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(g_init_flag, InitializeOnce, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  spdlog::shutdown();
  g_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  if (g_loggers.empty()) {
    auto logger = SilentLogger();
    g_loggers[DEFAULT_LOGGER] = logger;
    return logger;
  }

  auto it = g_loggers.find(name);
  return it != g_loggers.end() ? it->second : g_loggers[DEFAULT_LOGGER];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::shared_ptr<spdlog::logger> default_logger;
  {
    std::lock_guard<std::mutex> lock(g_loggers_mutex);
    const auto parsed = spdlog::level::from_str(level);
    for (auto &[name, logger] : g_loggers) {
      logger->set_level(parsed);
    }
    auto it = g_loggers.find(DEFAULT_LOGGER);
    if (it != g_loggers.end()) {
      default_logger = it->second;
    }
  }

  if (default_logger && level != "off") {
    default_logger->info("Log level changed to {}", level);
  }
}

void LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  bool known = false;
  std::shared_ptr<spdlog::logger> default_logger;
  {
    std::lock_guard<std::mutex> lock(g_loggers_mutex);
    auto it = g_loggers.find(component);
    if (it != g_loggers.end()) {
      it->second->set_level(spdlog::level::from_str(level));
      known = true;
    }
    auto def = g_loggers.find(DEFAULT_LOGGER);
    if (def != g_loggers.end()) {
      default_logger = def->second;
    }
  }

  if (!default_logger) {
    return;
  }
  if (known) {
    default_logger->debug("Component '{}' log level set to {}", component, level);
  } else {
    default_logger->warn("Unknown log component: {}", component);
  }
}

bool LogManager::IsKnownComponent(const std::string &component) {
  return std::find(COMPONENTS.begin(), COMPONENTS.end(), component) != COMPONENTS.end();
}

} // namespace util
} // namespace ircguard
