#ifndef ACCEPTOR_SERVER_CONNECTION_COUNTER_H
#define ACCEPTOR_SERVER_CONNECTION_COUNTER_H

#include <atomic>
#include <cstdint>

namespace acceptor {
namespace server {

/**
 * Count of open peer connections, for observability only.
 *
 * Lock-free; safe to update from every worker thread. The value is never
 * reset and may be transiently stale when read.
 */
class ConnectionCounter {
 public:
  ConnectionCounter() = default;
  ConnectionCounter(const ConnectionCounter&) = delete;
  ConnectionCounter& operator=(const ConnectionCounter&) = delete;

  // Process-wide counter shared by all acceptors
  static ConnectionCounter& global() {
    static ConnectionCounter counter;
    return counter;
  }

  // Returns the count after the increment
  int64_t increment() {
    return count_.fetch_add(1, std::memory_order_acq_rel) + 1;
  }

  // Returns the count before the decrement
  int64_t decrement() {
    return count_.fetch_sub(1, std::memory_order_acq_rel);
  }

  int64_t get() const { return count_.load(std::memory_order_acquire); }

 private:
  std::atomic<int64_t> count_{0};
};

}  // namespace server
}  // namespace acceptor

#endif  // ACCEPTOR_SERVER_CONNECTION_COUNTER_H
