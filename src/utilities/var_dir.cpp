#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace mosaic {

static std::string varDir = [] {
  const char *env = std::getenv("MOSAIC_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/mosaic"))
    return std::string("/var/mosaic");
  return std::string("var/mosaic");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string storeDir() { return getVarDir() + "/store"; }

} // namespace mosaic
