#include "acceptor/server/acceptor_connection_callbacks.h"

#include <stdexcept>

#define ACCEPTOR_LOG_COMPONENT "Server.callbacks"
#include "acceptor/logging/log_macros.h"

namespace acceptor {
namespace server {

AcceptorConnectionCallbacks::AcceptorConnectionCallbacks(
    AcceptorHandler& handler, const network::ConnectionSharedPtr& connection)
    : handler_(handler),
      connection_(connection),
      raw_connection_(connection.get()) {
  if (!connection) {
    throw std::invalid_argument("AcceptorConnectionCallbacks needs a connection");
  }
}

AcceptorConnectionCallbacks::~AcceptorConnectionCallbacks() {
  if (!registered_) {
    return;
  }
  auto connection = connection_.lock();
  if (connection) {
    connection->removeConnectionCallbacks(*this);
  }
}

AcceptorConnectionCallbacksPtr AcceptorConnectionCallbacks::install(
    AcceptorHandler& handler, const network::ConnectionSharedPtr& connection) {
  auto callbacks =
      std::make_unique<AcceptorConnectionCallbacks>(handler, connection);
  connection->addConnectionCallbacks(*callbacks);
  callbacks->registered_ = true;
  return callbacks;
}

void AcceptorConnectionCallbacks::onEvent(network::ConnectionEvent event) {
  switch (event) {
    case network::ConnectionEvent::Connected:
      if (!connected_) {
        connected_ = true;
        handler_.onConnect(*raw_connection_);
      }
      break;
    case network::ConnectionEvent::RemoteClose:
    case network::ConnectionEvent::LocalClose:
      // A connection that never became active was never counted
      if (connected_ && !disconnected_) {
        disconnected_ = true;
        handler_.onDisconnect(*raw_connection_);
      }
      break;
  }
}

void AcceptorConnectionCallbacks::onAboveWriteBufferHighWatermark() {
  handler_.onWritabilityChanged(*raw_connection_);
}

void AcceptorConnectionCallbacks::onBelowWriteBufferLowWatermark() {
  handler_.onWritabilityChanged(*raw_connection_);
}

void AcceptorConnectionCallbacks::onMessage(
    const message::MessageSharedPtr& msg) {
  auto connection = connection_.lock();
  if (!connection || disconnected_) {
    ACCEPTOR_LOG_DEBUG("message for a {} connection dropped",
                       connection ? "disconnected" : "destroyed");
    if (msg) {
      msg->release();
    }
    return;
  }
  handler_.onMessage(connection, msg);
}

void AcceptorConnectionCallbacks::onFault(std::exception_ptr exception) {
  auto connection = connection_.lock();
  if (!connection) {
    return;
  }
  handler_.onFault(*connection, fault::Fault::capture(std::move(exception)));
}

}  // namespace server
}  // namespace acceptor
