#ifndef ACCEPTOR_NETWORK_CONNECTION_H
#define ACCEPTOR_NETWORK_CONNECTION_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "acceptor/event/event_loop.h"
#include "acceptor/message/message.h"

namespace acceptor {

namespace channel {
class Channel;
using ChannelSharedPtr = std::shared_ptr<Channel>;
}  // namespace channel

namespace network {

class Connection;
class ConnectionCallbacks;

using ConnectionSharedPtr = std::shared_ptr<Connection>;
using ConnectionWeakPtr = std::weak_ptr<Connection>;

/**
 * Connection events
 */
enum class ConnectionEvent {
  RemoteClose,  // Peer closed the connection
  LocalClose,   // Connection closed locally
  Connected     // Connection established
};

/**
 * Connection close types
 */
enum class ConnectionCloseType {
  FlushWrite,  // Flush pending writes then close
  NoFlush,     // Close immediately, dropping pending writes
  Abort        // Reset the connection
};

/**
 * Connection state
 */
enum class ConnectionState {
  Open,     // Connection is open
  Closing,  // Connection is closing
  Closed    // Connection is closed
};

/**
 * Connection callbacks interface
 */
class ConnectionCallbacks {
 public:
  virtual ~ConnectionCallbacks() = default;

  /**
   * Called when a connection event occurs
   */
  virtual void onEvent(ConnectionEvent event) = 0;

  /**
   * Called when the write buffer goes above its high watermark
   */
  virtual void onAboveWriteBufferHighWatermark() = 0;

  /**
   * Called when the write buffer goes below its low watermark
   */
  virtual void onBelowWriteBufferLowWatermark() = 0;
};

/**
 * One live transport connection as seen by the acceptor.
 *
 * All events of a connection are delivered on its dispatcher thread. The
 * watermark thresholds and outbound counters belong to the transport; the
 * acceptor only reads them.
 */
class Connection {
 public:
  virtual ~Connection() = default;

  /**
   * Process unique, monotonically assigned id
   */
  virtual uint64_t id() const = 0;

  /**
   * Peer address in "host:port" form, empty if unknown
   */
  virtual const std::string& remoteAddress() const = 0;

  virtual ConnectionState state() const = 0;

  /**
   * Close the connection. Closing a closing or closed connection is a
   * no-op.
   */
  virtual void close(ConnectionCloseType type) = 0;

  /**
   * Disable or re-enable reading from the socket
   */
  virtual void readDisable(bool disable) = 0;
  virtual bool readEnabled() const = 0;

  /**
   * False while the outbound queue is above its high watermark
   */
  virtual bool isWritable() const = 0;
  virtual uint32_t writeBufferHighWatermark() const = 0;
  virtual uint32_t writeBufferLowWatermark() const = 0;

  /**
   * Entries flushed to the transport but not yet written to the socket
   */
  virtual size_t pendingWriteEntries() const = 0;

  /**
   * Queue a response for writing. Dropped if the connection is not open.
   * Must be called on the dispatcher thread.
   */
  virtual void write(const message::ResponseEnvelopeSharedPtr& response) = 0;

  virtual event::Dispatcher& dispatcher() = 0;

  // Per-connection channel slot, see channel::Channel::attach()
  virtual channel::ChannelSharedPtr channel() const = 0;
  virtual void setChannel(channel::ChannelSharedPtr channel) = 0;

  virtual void addConnectionCallbacks(ConnectionCallbacks& cb) = 0;
  virtual void removeConnectionCallbacks(ConnectionCallbacks& cb) = 0;
};

/**
 * Identity used in log lines, e.g. "#7 (10.0.0.1:5000)"
 */
std::string describe(const Connection& connection);

const char* connectionEventToString(ConnectionEvent event);

}  // namespace network
}  // namespace acceptor

#endif  // ACCEPTOR_NETWORK_CONNECTION_H
