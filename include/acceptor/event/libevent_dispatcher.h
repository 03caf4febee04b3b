#ifndef ACCEPTOR_EVENT_LIBEVENT_DISPATCHER_H
#define ACCEPTOR_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "acceptor/event/event_loop.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace acceptor {
namespace event {

using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 *
 * Cross-thread post() wakes the loop through a non-blocking pipe.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  // DispatcherBase interface
  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  // Dispatcher interface
  const std::string& name() override { return name_; }
  void exit() override;
  void run(RunType type) override;

  // Get the underlying event_base for advanced usage
  event_base* base() { return base_; }

 private:
  void runPostCallbacks();
  void initializeLibevent();
  void wakeup();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};
  libevent_event* wakeup_event_{nullptr};
};

/**
 * @brief Factory for creating libevent-based dispatchers
 */
class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;

 private:
  static const std::string backend_name_;
};

}  // namespace event
}  // namespace acceptor

#endif  // ACCEPTOR_EVENT_LIBEVENT_DISPATCHER_H
