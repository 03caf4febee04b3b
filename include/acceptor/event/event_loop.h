#ifndef ACCEPTOR_EVENT_EVENT_LOOP_H
#define ACCEPTOR_EVENT_EVENT_LOOP_H

#include <functional>
#include <memory>
#include <string>

namespace acceptor {
namespace event {

class Dispatcher;
class DispatcherFactory;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

using PostCb = std::function<void()>;

enum class RunType {
  Block,        // Run until there are no more pending events
  NonBlock,     // Run one non-blocking iteration
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief Minimal interface for posting work onto a worker context
 */
class DispatcherBase {
 public:
  virtual ~DispatcherBase() = default;

  /**
   * Post a callback to be executed in the dispatcher thread.
   * Thread-safe: can be called from any thread.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Check if the current thread is the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;
};

/**
 * @brief Worker context event loop
 *
 * Each worker thread runs one dispatcher. All events of a connection are
 * handled on the dispatcher that owns it, which gives the per-connection
 * total order the acceptor relies on.
 */
class Dispatcher : public DispatcherBase {
 public:
  ~Dispatcher() override = default;

  /**
   * Return the name of this dispatcher (e.g., "worker_0").
   */
  virtual const std::string& name() = 0;

  /**
   * Exit the event loop. Safe to call from any thread.
   */
  virtual void exit() = 0;

  /**
   * Run the event loop on the calling thread.
   */
  virtual void run(RunType type) = 0;
};

/**
 * @brief Factory for creating dispatchers of one backend
 */
class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  /**
   * Backend name (e.g., "libevent")
   */
  virtual const std::string& backendName() const = 0;
};

/**
 * @brief Create a libevent-based dispatcher factory
 */
DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace acceptor

#endif  // ACCEPTOR_EVENT_EVENT_LOOP_H
