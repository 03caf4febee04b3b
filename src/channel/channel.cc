#include "acceptor/channel/channel.h"

#include <stdexcept>

#define ACCEPTOR_LOG_COMPONENT "Channel"
#include "acceptor/logging/log_macros.h"

namespace acceptor {
namespace channel {

ChannelSharedPtr Channel::attach(
    const network::ConnectionSharedPtr& connection) {
  if (!connection) {
    throw std::invalid_argument("cannot attach a channel to a null connection");
  }
  // Events of one connection are serialized on its dispatcher, so the
  // check-then-set below cannot race with itself.
  ChannelSharedPtr channel = connection->channel();
  if (!channel) {
    channel = std::make_shared<Channel>(connection);
    connection->setChannel(channel);
    if (connection->state() != network::ConnectionState::Open) {
      channel->detach();
    }
  }
  return channel;
}

Channel::Channel(const network::ConnectionSharedPtr& connection)
    : connection_(connection),
      id_(connection->id()),
      remote_address_(connection->remoteAddress()) {}

bool Channel::isActive() const {
  if (detached_.load()) {
    return false;
  }
  auto connection = lockConnection();
  return connection &&
         connection->state() == network::ConnectionState::Open;
}

bool Channel::write(message::ResponseEnvelopeSharedPtr response) {
  if (detached_.load()) {
    ACCEPTOR_LOG_DEBUG("channel #{} detached, dropping response {}", id_,
                       response ? response->invokeId() : 0);
    return false;
  }
  auto connection = lockConnection();
  if (!connection) {
    detach();
    return false;
  }

  event::Dispatcher& dispatcher = connection->dispatcher();
  if (dispatcher.isThreadSafe()) {
    connection->write(response);
    return true;
  }

  auto self = shared_from_this();
  dispatcher.post([self, response]() {
    if (self->detached()) {
      return;
    }
    auto connection = self->lockConnection();
    if (connection) {
      connection->write(response);
    }
  });
  return true;
}

void Channel::close() {
  auto connection = lockConnection();
  if (!connection) {
    return;
  }

  event::Dispatcher& dispatcher = connection->dispatcher();
  if (dispatcher.isThreadSafe()) {
    connection->close(network::ConnectionCloseType::FlushWrite);
    return;
  }

  network::ConnectionWeakPtr weak = connection;
  dispatcher.post([weak]() {
    auto connection = weak.lock();
    if (!connection) {
      return;
    }
    try {
      connection->close(network::ConnectionCloseType::FlushWrite);
    } catch (const std::exception& e) {
      ACCEPTOR_LOG_ERROR("failed to close connection {}: {}",
                         network::describe(*connection), e.what());
    }
  });
}

void Channel::detach() {
  if (!detached_.exchange(true)) {
    ACCEPTOR_LOG_DEBUG("channel #{} detached", id_);
  }
}

network::ConnectionSharedPtr Channel::lockConnection() const {
  return connection_.lock();
}

}  // namespace channel
}  // namespace acceptor
