#ifndef ACCEPTOR_SERVER_ACCEPTOR_HANDLER_H
#define ACCEPTOR_SERVER_ACCEPTOR_HANDLER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

#include "acceptor/fault/fault.h"
#include "acceptor/logging/logger.h"
#include "acceptor/message/message.h"
#include "acceptor/network/connection.h"
#include "acceptor/processor/provider_processor.h"
#include "acceptor/server/connection_counter.h"

namespace acceptor {
namespace server {

/**
 * Inbound event handler of the RPC acceptor.
 *
 * A single instance is shared by every connection on every worker thread.
 * Its only mutable state is the connection counter; everything else lives
 * on the connection. Entry points never throw: processor failures become
 * SERVER_ERROR replies, transport failures close the connection, and
 * anything else is logged. A failing log sink is counted and otherwise
 * ignored.
 */
class AcceptorHandler {
 public:
  struct Options {
    // Severity of the writability transition log lines
    logging::LogLevel writability_log_level{logging::LogLevel::Warning};
  };

  /**
   * Throws std::invalid_argument if processor is null.
   */
  explicit AcceptorHandler(processor::ProviderProcessorSharedPtr processor);

  /**
   * @param counter open connection counter, ConnectionCounter::global() by
   *        default
   * @param logger destination of handler events, the "Server.acceptor"
   *        logger if null
   */
  AcceptorHandler(processor::ProviderProcessorSharedPtr processor,
                  const Options& options,
                  ConnectionCounter& counter = ConnectionCounter::global(),
                  logging::LoggerSharedPtr logger = nullptr);

  /**
   * A connection became active
   */
  void onConnect(network::Connection& connection);

  /**
   * A connection went away. Called exactly once per connection.
   */
  void onDisconnect(network::Connection& connection);

  /**
   * A decoded message arrived. Anything but a RequestEnvelope, and
   * anything arriving after the connection stopped being open, is released
   * and dropped.
   */
  void onMessage(const network::ConnectionSharedPtr& connection,
                 const message::MessageSharedPtr& msg);

  /**
   * The connection's writability flipped; toggles reading accordingly
   */
  void onWritabilityChanged(network::Connection& connection);

  /**
   * A fault surfaced from the connection pipeline
   */
  void onFault(network::Connection& connection, const fault::Fault& fault);

  ConnectionCounter& counter() { return counter_; }
  const Options& options() const { return options_; }
  const logging::LoggerSharedPtr& logger() const { return logger_; }

  // Log events lost because the sink threw
  uint64_t droppedLogEvents() const {
    return dropped_log_events_.load(std::memory_order_relaxed);
  }

 private:
  template <typename... Args>
  void emit(logging::LogLevel level,
            const logging::LogContext& ctx,
            const char* fmt,
            Args&&... args) noexcept {
    try {
      logger_->logWithContext(level, ctx, fmt, std::forward<Args>(args)...);
    } catch (...) {
      dropped_log_events_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  void closeConnection(network::Connection& connection);

  const processor::ProviderProcessorSharedPtr processor_;
  const Options options_;
  ConnectionCounter& counter_;
  const logging::LoggerSharedPtr logger_;
  std::atomic<uint64_t> dropped_log_events_{0};
};

}  // namespace server
}  // namespace acceptor

#endif  // ACCEPTOR_SERVER_ACCEPTOR_HANDLER_H
