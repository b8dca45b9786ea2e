#pragma once

#include <string>

namespace mosaic {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string storeDir();

} // namespace mosaic
