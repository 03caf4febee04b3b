#ifndef ACCEPTOR_CHANNEL_CHANNEL_H
#define ACCEPTOR_CHANNEL_CHANNEL_H

#include <atomic>
#include <memory>
#include <string>

#include "acceptor/message/message.h"
#include "acceptor/network/connection.h"

namespace acceptor {
namespace channel {

/**
 * Per-connection reply handle handed to processors.
 *
 * A channel outlives neither the usefulness of its connection nor its
 * ownership: it holds the connection weakly and is detached when the
 * connection closes, after which writes are dropped. write() and close()
 * may be called from any thread; work is posted to the connection's
 * dispatcher when needed.
 */
class Channel : public std::enable_shared_from_this<Channel> {
 public:
  /**
   * Return the channel cached on the connection, creating and caching one
   * on first use. Repeated calls for the same connection return the same
   * channel.
   */
  static ChannelSharedPtr attach(const network::ConnectionSharedPtr& connection);

  explicit Channel(const network::ConnectionSharedPtr& connection);

  uint64_t id() const { return id_; }
  const std::string& remoteAddress() const { return remote_address_; }

  /**
   * True while attached to an open connection
   */
  bool isActive() const;

  /**
   * Queue a response on the connection. Returns false if the channel is
   * detached and the response was dropped. Delivery is not confirmed.
   */
  bool write(message::ResponseEnvelopeSharedPtr response);

  /**
   * Close the underlying connection, flushing pending writes
   */
  void close();

  /**
   * Cut the channel off its connection. Idempotent.
   */
  void detach();
  bool detached() const { return detached_.load(); }

 private:
  network::ConnectionSharedPtr lockConnection() const;

  const network::ConnectionWeakPtr connection_;
  const uint64_t id_;
  const std::string remote_address_;
  std::atomic<bool> detached_{false};
};

}  // namespace channel
}  // namespace acceptor

#endif  // ACCEPTOR_CHANNEL_CHANNEL_H
