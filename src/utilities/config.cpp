#include "utilities/config.hpp"
#include "utilities/var_dir.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace mosaic {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

static bool parseBool(const std::string &value) {
  std::string v = lower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  throw std::runtime_error("Invalid boolean value: " + value);
}

static size_t parseCount(const std::string &value) {
  size_t used = 0;
  unsigned long long n = 0;
  try {
    n = std::stoull(value, &used);
  } catch (const std::logic_error &) {
    throw std::runtime_error("Invalid count: " + value);
  }
  if (used != value.size() || value.find('-') != std::string::npos)
    throw std::runtime_error("Invalid count: " + value);
  return static_cast<size_t>(n);
}

utils::HashAlgorithm parseHashAlgorithm(const std::string &name) {
  std::string n = lower(name);
  if (n == "blake3")
    return utils::HashAlgorithm::BLAKE3;
  if (n == "sha256" || n == "sha-256")
    return utils::HashAlgorithm::SHA256;
  throw std::runtime_error("Unknown hash algorithm: " + name);
}

LogLevel parseLogLevel(const std::string &name) {
  std::string n = lower(name);
  if (n == "trace")
    return LogLevel::TRACE;
  if (n == "debug")
    return LogLevel::DEBUG;
  if (n == "info")
    return LogLevel::INFO;
  if (n == "warn" || n == "warning")
    return LogLevel::WARN;
  if (n == "error")
    return LogLevel::ERROR;
  if (n == "fatal")
    return LogLevel::FATAL;
  throw std::runtime_error("Unknown log level: " + name);
}

MosaicConfig loadConfig(const std::string &path) {
  MosaicConfig opts;
  opts.storeDir = storeDir();
  opts.logFile = logsDir() + "/mosaic.log";

  std::string cfg = path;
  if (cfg.empty()) {
    const char *env = std::getenv("MOSAIC_CONFIG");
    cfg = env ? env : "mosaic_config.yaml";
  }

  if (std::filesystem::exists(cfg)) {
    try {
      YAML::Node node = YAML::LoadFile(cfg);
      if (node["store_backend"])
        opts.storeBackend = node["store_backend"].as<std::string>();
      if (node["store_dir"])
        opts.storeDir = node["store_dir"].as<std::string>();
      if (node["compression_level"])
        opts.compressionLevel = node["compression_level"].as<int>();
      if (node["hash_algorithm"])
        opts.hashAlgorithm =
            parseHashAlgorithm(node["hash_algorithm"].as<std::string>());
      if (node["parallel_fanout"])
        opts.parallelFanout = node["parallel_fanout"].as<bool>();
      if (node["max_fanout_threads"])
        opts.maxFanoutThreads = node["max_fanout_threads"].as<size_t>();
      if (node["log_file"])
        opts.logFile = node["log_file"].as<std::string>();
      if (node["log_level"])
        opts.logLevel = parseLogLevel(node["log_level"].as<std::string>());
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Failed to parse config " + cfg + ": " +
                               e.what());
    }
  }

  if (const char *env = std::getenv("MOSAIC_STORE_BACKEND"))
    opts.storeBackend = env;
  if (const char *env = std::getenv("MOSAIC_STORE_DIR"))
    opts.storeDir = env;
  if (const char *env = std::getenv("MOSAIC_COMPRESSION_LEVEL"))
    opts.compressionLevel = std::atoi(env);
  if (const char *env = std::getenv("MOSAIC_HASH_ALGO"))
    opts.hashAlgorithm = parseHashAlgorithm(env);
  if (const char *env = std::getenv("MOSAIC_PARALLEL_FANOUT"))
    opts.parallelFanout = parseBool(env);
  if (const char *env = std::getenv("MOSAIC_MAX_FANOUT_THREADS"))
    opts.maxFanoutThreads = parseCount(env);
  if (const char *env = std::getenv("MOSAIC_LOG_LEVEL"))
    opts.logLevel = parseLogLevel(env);
  return opts;
}

} // namespace mosaic
