#include "acceptor/server/acceptor_handler.h"

#include <stdexcept>
#include <string>

#include "acceptor/channel/channel.h"
#include "acceptor/logging/logger_registry.h"

namespace acceptor {
namespace server {

namespace {

logging::LogContext eventContext(const network::Connection& connection,
                                 const char* event) {
  logging::LogContext ctx;
  ctx.component = logging::Component::Server;
  ctx.connection_id = std::to_string(connection.id());
  ctx.with("event", event);
  return ctx;
}

logging::LoggerSharedPtr defaultLogger() {
  return logging::LoggerRegistry::instance().getComponentLogger(
      logging::Component::Server, "acceptor");
}

}  // namespace

AcceptorHandler::AcceptorHandler(
    processor::ProviderProcessorSharedPtr processor)
    : AcceptorHandler(std::move(processor), Options()) {}

AcceptorHandler::AcceptorHandler(
    processor::ProviderProcessorSharedPtr processor,
    const Options& options,
    ConnectionCounter& counter,
    logging::LoggerSharedPtr logger)
    : processor_(std::move(processor)),
      options_(options),
      counter_(counter),
      logger_(logger ? std::move(logger) : defaultLogger()) {
  if (!processor_) {
    throw std::invalid_argument("AcceptorHandler requires a processor");
  }
}

void AcceptorHandler::onConnect(network::Connection& connection) {
  const int64_t count = counter_.increment();

  auto ctx = eventContext(connection, "connect");
  ctx.with("count", count);
  emit(logging::LogLevel::Info, ctx,
       "connection {} connected, open connections: {}",
       network::describe(connection), count);
}

void AcceptorHandler::onDisconnect(network::Connection& connection) {
  const int64_t count = counter_.decrement();

  auto ctx = eventContext(connection, "disconnect");
  ctx.with("count", count);
  emit(logging::LogLevel::Warning, ctx,
       "connection {} disconnected, open connections before close: {}",
       network::describe(connection), count);
}

void AcceptorHandler::onMessage(const network::ConnectionSharedPtr& connection,
                                const message::MessageSharedPtr& msg) {
  if (!connection) {
    if (msg) {
      msg->release();
    }
    return;
  }

  // Frames decoded before a close may still be in flight
  if (connection->state() != network::ConnectionState::Open) {
    const char* type = msg ? msg->typeName() : "null";
    auto ctx = eventContext(*connection, "message_after_close");
    ctx.with("message_type", type);
    emit(logging::LogLevel::Debug, ctx,
         "{} on closed connection {}, discarded", type,
         network::describe(*connection));
    if (msg) {
      msg->release();
    }
    return;
  }

  auto request = std::dynamic_pointer_cast<message::RequestEnvelope>(msg);
  if (!request) {
    const char* type = msg ? msg->typeName() : "null";
    auto ctx = eventContext(*connection, "unexpected_message");
    ctx.with("message_type", type);
    emit(logging::LogLevel::Warning, ctx,
         "unexpected message {} on connection {}, discarded", type,
         network::describe(*connection));
    if (msg) {
      msg->release();
    }
    return;
  }

  channel::ChannelSharedPtr channel;
  try {
    channel = channel::Channel::attach(connection);
  } catch (...) {
    onFault(*connection, fault::Fault::current());
    return;
  }

  try {
    processor_->handleRequest(channel, request);
  } catch (...) {
    const fault::Fault fault = fault::Fault::current();
    try {
      processor_->handleException(channel, request,
                                  message::Status::ServerError, fault);
    } catch (...) {
      const fault::Fault handler_fault = fault::Fault::current();
      auto ctx = eventContext(*connection, "exception_handler_fault");
      ctx.request_id = std::to_string(request->invokeId());
      emit(logging::LogLevel::Error, ctx,
           "failed to report {} for request {} on connection {}: {}",
           fault.describe(), request->invokeId(),
           network::describe(*connection), handler_fault.describe());
      onFault(*connection, handler_fault);
    }
  }
}

void AcceptorHandler::onWritabilityChanged(network::Connection& connection) {
  const logging::LogLevel level = options_.writability_log_level;
  const bool writable = connection.isWritable();

  if (!writable) {
    auto ctx = eventContext(connection, "unwritable");
    ctx.with("high_water_mark", connection.writeBufferHighWatermark());
    ctx.with("pending_entries", connection.pendingWriteEntries());
    emit(level, ctx,
         "connection {} is not writable, high water mark: {}, pending "
         "entries: {}; reads disabled",
         network::describe(connection), connection.writeBufferHighWatermark(),
         connection.pendingWriteEntries());
  } else {
    auto ctx = eventContext(connection, "writable");
    ctx.with("low_water_mark", connection.writeBufferLowWatermark());
    ctx.with("pending_entries", connection.pendingWriteEntries());
    emit(level, ctx,
         "connection {} is writable again, low water mark: {}, pending "
         "entries: {}; reads enabled",
         network::describe(connection), connection.writeBufferLowWatermark(),
         connection.pendingWriteEntries());
  }

  try {
    connection.readDisable(!writable);
  } catch (...) {
    const fault::Fault fault = fault::Fault::current();
    emit(logging::LogLevel::Error,
         eventContext(connection, "read_disable_failed"),
         "failed to {} reads on connection {}: {}",
         writable ? "enable" : "disable", network::describe(connection),
         fault.describe());
  }
}

void AcceptorHandler::onFault(network::Connection& connection,
                              const fault::Fault& fault) {
  switch (fault.category()) {
    case fault::FaultCategory::Signal: {
      const auto& signal = std::get<fault::SignalFault>(fault.detail());
      auto ctx = eventContext(connection, "signal_fault");
      ctx.with("signal", signal.name);
      emit(logging::LogLevel::Error, ctx,
           "signal {} on connection {}, closing", signal.name,
           network::describe(connection));
      break;
    }
    case fault::FaultCategory::TransportIo:
      emit(logging::LogLevel::Error, eventContext(connection, "io_fault"),
           "I/O error on connection {}, closing: {}",
           network::describe(connection), fault.trace());
      break;
    case fault::FaultCategory::Unclassified:
      emit(logging::LogLevel::Error,
           eventContext(connection, "unclassified_fault"),
           "unexpected fault on connection {}: {}",
           network::describe(connection), fault.trace());
      break;
  }

  if (fault::classify(fault) == fault::FaultAction::Close) {
    closeConnection(connection);
  }
}

void AcceptorHandler::closeConnection(network::Connection& connection) {
  try {
    connection.close(network::ConnectionCloseType::NoFlush);
  } catch (...) {
    const fault::Fault fault = fault::Fault::current();
    emit(logging::LogLevel::Error, eventContext(connection, "close_failed"),
         "failed to close connection {}: {}", network::describe(connection),
         fault.describe());
  }
}

}  // namespace server
}  // namespace acceptor
