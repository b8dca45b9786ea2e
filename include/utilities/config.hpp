#ifndef MOSAIC_CONFIG_HPP
#define MOSAIC_CONFIG_HPP

#include "utilities/digest.hpp"
#include "utilities/fanout.hpp"
#include "utilities/logger.h"
#include <cstddef>
#include <string>

namespace mosaic {

/**
 * @brief Runtime options shared by the library and mosaic_ctl.
 */
struct MosaicConfig {
  std::string storeBackend = "memory"; ///< "memory" or "file"
  std::string storeDir;                ///< Root of the file store
  int compressionLevel = 1;            ///< Zstd level for the file store
  utils::HashAlgorithm hashAlgorithm = utils::HashAlgorithm::BLAKE3;
  bool parallelFanout = true; ///< Run child merges/saves on their own threads
  size_t maxFanoutThreads = DEFAULT_FANOUT_THREADS; ///< Cap on those threads
  std::string logFile;
  LogLevel logLevel = LogLevel::INFO;
};

/**
 * @brief Load configuration from YAML, then apply environment overrides.
 *
 * The file is @p path if given, else $MOSAIC_CONFIG, else
 * mosaic_config.yaml. A missing file yields the defaults.
 *
 * @throws std::runtime_error if the file exists but cannot be parsed, or a
 *         value is not recognised.
 */
MosaicConfig loadConfig(const std::string &path = "");

/** @throws std::runtime_error for names other than blake3/sha256. */
utils::HashAlgorithm parseHashAlgorithm(const std::string &name);

/** @throws std::runtime_error for names other than trace..fatal. */
LogLevel parseLogLevel(const std::string &name);

} // namespace mosaic

#endif // MOSAIC_CONFIG_HPP
