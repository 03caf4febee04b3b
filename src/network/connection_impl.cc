#include "acceptor/network/connection_impl.h"

#include <algorithm>

#include <fmt/format.h>

#include "acceptor/channel/channel.h"

#define ACCEPTOR_LOG_COMPONENT "Network.connection"
#include "acceptor/logging/log_macros.h"

namespace acceptor {
namespace network {

std::string describe(const Connection& connection) {
  if (connection.remoteAddress().empty()) {
    return fmt::format("#{}", connection.id());
  }
  return fmt::format("#{} ({})", connection.id(), connection.remoteAddress());
}

const char* connectionEventToString(ConnectionEvent event) {
  switch (event) {
    case ConnectionEvent::RemoteClose:
      return "RemoteClose";
    case ConnectionEvent::LocalClose:
      return "LocalClose";
    case ConnectionEvent::Connected:
      return "Connected";
  }
  return "Unknown";
}

std::atomic<uint64_t> ConnectionImplBase::next_connection_id_{1};

ConnectionImplBase::ConnectionImplBase(event::Dispatcher& dispatcher,
                                       std::string remote_address)
    : dispatcher_(dispatcher),
      id_(next_connection_id_++),
      remote_address_(std::move(remote_address)),
      write_buffer_([this]() { onWriteBufferHighWatermark(); },
                    [this]() { onWriteBufferLowWatermark(); }) {}

ConnectionImplBase::~ConnectionImplBase() {
  // Replies still held by a processor must not reach a dead connection
  channel::ChannelSharedPtr channel;
  {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    channel.swap(channel_);
  }
  if (channel) {
    channel->detach();
  }
}

void ConnectionImplBase::close(ConnectionCloseType type) {
  ConnectionState expected = ConnectionState::Open;
  if (!state_.compare_exchange_strong(expected, ConnectionState::Closing)) {
    return;
  }

  ACCEPTOR_LOG_DEBUG("closing connection {}", describe(*this));

  std::exception_ptr close_error;
  try {
    closeSocket(type);
  } catch (...) {
    close_error = std::current_exception();
  }

  markClosedAndDetach();
  raiseConnectionEvent(ConnectionEvent::LocalClose);

  if (close_error) {
    std::rethrow_exception(close_error);
  }
}

void ConnectionImplBase::onConnected() {
  raiseConnectionEvent(ConnectionEvent::Connected);
}

void ConnectionImplBase::onRemoteClose() {
  ConnectionState expected = ConnectionState::Open;
  if (!state_.compare_exchange_strong(expected, ConnectionState::Closing)) {
    return;
  }
  markClosedAndDetach();
  raiseConnectionEvent(ConnectionEvent::RemoteClose);
}

void ConnectionImplBase::markClosedAndDetach() {
  state_ = ConnectionState::Closed;

  channel::ChannelSharedPtr channel;
  {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    channel = channel_;
  }
  if (channel) {
    channel->detach();
  }
}

void ConnectionImplBase::readDisable(bool disable) {
  bool was_enabled = read_enabled_.exchange(!disable);
  if (was_enabled == disable) {
    onReadDisableChanged(disable);
  }
}

bool ConnectionImplBase::isWritable() const {
  return !write_buffer_.aboveHighWatermark();
}

uint32_t ConnectionImplBase::writeBufferHighWatermark() const {
  return write_buffer_.highWatermark();
}

uint32_t ConnectionImplBase::writeBufferLowWatermark() const {
  return write_buffer_.lowWatermark();
}

size_t ConnectionImplBase::pendingWriteEntries() const {
  return write_buffer_.entries();
}

void ConnectionImplBase::setWriteBufferWatermarks(uint32_t high_watermark,
                                                  uint32_t low_watermark) {
  write_buffer_.setWatermarks(high_watermark, low_watermark);
}

void ConnectionImplBase::write(
    const message::ResponseEnvelopeSharedPtr& response) {
  if (!response) {
    return;
  }
  if (state_.load() != ConnectionState::Open) {
    ACCEPTOR_LOG_DEBUG("dropping response {} on closed connection {}",
                       response->invokeId(), describe(*this));
    return;
  }
  size_t bytes = doWrite(response);
  write_buffer_.add(bytes, 1);
}

void ConnectionImplBase::onWriteComplete(size_t bytes, size_t entries) {
  write_buffer_.drain(bytes, entries);
}

channel::ChannelSharedPtr ConnectionImplBase::channel() const {
  std::lock_guard<std::mutex> lock(channel_mutex_);
  return channel_;
}

void ConnectionImplBase::setChannel(channel::ChannelSharedPtr channel) {
  std::lock_guard<std::mutex> lock(channel_mutex_);
  channel_ = std::move(channel);
}

void ConnectionImplBase::addConnectionCallbacks(ConnectionCallbacks& cb) {
  callbacks_.push_back(&cb);
}

void ConnectionImplBase::removeConnectionCallbacks(ConnectionCallbacks& cb) {
  callbacks_.erase(std::remove(callbacks_.begin(), callbacks_.end(), &cb),
                   callbacks_.end());
}

void ConnectionImplBase::raiseConnectionEvent(ConnectionEvent event) {
  // Callbacks may unregister themselves while handling the event
  auto callbacks = callbacks_;
  for (auto* cb : callbacks) {
    cb->onEvent(event);
  }
}

void ConnectionImplBase::onWriteBufferHighWatermark() {
  auto callbacks = callbacks_;
  for (auto* cb : callbacks) {
    cb->onAboveWriteBufferHighWatermark();
  }
}

void ConnectionImplBase::onWriteBufferLowWatermark() {
  auto callbacks = callbacks_;
  for (auto* cb : callbacks) {
    cb->onBelowWriteBufferLowWatermark();
  }
}

}  // namespace network
}  // namespace acceptor
