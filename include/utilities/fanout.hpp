#ifndef MOSAIC_FANOUT_HPP
#define MOSAIC_FANOUT_HPP

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mosaic {

/// Worker threads a manifest operation may run at once unless configured.
inline constexpr size_t DEFAULT_FANOUT_THREADS = 64;

/**
 * @brief Counting budget of worker threads shared by one tree operation.
 *
 * Work that finds the budget used up runs inline on the caller's thread, so
 * a wide tree never holds more than limit() extra threads.
 */
class FanoutBudget {
public:
  explicit FanoutBudget(size_t limit) : limit_(limit) {}

  FanoutBudget(const FanoutBudget &) = delete;
  FanoutBudget &operator=(const FanoutBudget &) = delete;

  /** Take one slot; false if all limit() slots are in use. */
  bool tryAcquire();
  void release();

  size_t limit() const { return limit_; }
  size_t inUse() const;

private:
  const size_t limit_;
  mutable std::mutex mutex_;
  size_t inUse_ = 0;
};

/// Holds one budget slot for the lifetime of a worker.
class FanoutSlot {
public:
  explicit FanoutSlot(std::shared_ptr<FanoutBudget> budget)
      : budget_(std::move(budget)) {}
  ~FanoutSlot() { budget_->release(); }

  FanoutSlot(const FanoutSlot &) = delete;
  FanoutSlot &operator=(const FanoutSlot &) = delete;

private:
  std::shared_ptr<FanoutBudget> budget_;
};

/**
 * @brief Run @p fn on a new thread if @p budget has a free slot, otherwise
 * defer it until the returned future is waited on.
 *
 * The slot is given back before the future becomes ready.
 */
template <typename F>
std::future<std::invoke_result_t<F &>>
spawnBounded(const std::shared_ptr<FanoutBudget> &budget, F fn) {
  if (budget && budget->tryAcquire()) {
    std::shared_ptr<FanoutBudget> held = budget;
    try {
      return std::async(std::launch::async, [held, fn]() mutable {
        FanoutSlot slot(held);
        return fn();
      });
    } catch (const std::system_error &) {
      // The OS refused a thread even though the budget had room.
      held->release();
    }
  }
  return std::async(std::launch::deferred, std::move(fn));
}

} // namespace mosaic

#endif // MOSAIC_FANOUT_HPP
