#include "utilities/fanout.hpp"

namespace mosaic {

bool FanoutBudget::tryAcquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (inUse_ >= limit_) {
    return false;
  }
  ++inUse_;
  return true;
}

void FanoutBudget::release() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (inUse_ > 0) {
    --inUse_;
  }
}

size_t FanoutBudget::inUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inUse_;
}

} // namespace mosaic
