#ifndef ACCEPTOR_NETWORK_CONNECTION_IMPL_H
#define ACCEPTOR_NETWORK_CONNECTION_IMPL_H

#include <atomic>
#include <mutex>
#include <vector>

#include "acceptor/network/connection.h"
#include "acceptor/network/write_buffer_watermark.h"

namespace acceptor {
namespace network {

/**
 * Base implementation of Connection shared by transports.
 *
 * Owns the connection id, the open/closing/closed state, the read-disable
 * flag, write watermark accounting and the channel slot. Transports supply
 * the socket side through doWrite() and closeSocket() and report progress
 * through onWriteComplete() and onRemoteClose().
 */
class ConnectionImplBase : public Connection {
 public:
  ~ConnectionImplBase() override;

  // Connection interface
  uint64_t id() const override { return id_; }
  const std::string& remoteAddress() const override { return remote_address_; }
  ConnectionState state() const override { return state_.load(); }
  void close(ConnectionCloseType type) override;
  void readDisable(bool disable) override;
  bool readEnabled() const override { return read_enabled_.load(); }
  bool isWritable() const override;
  uint32_t writeBufferHighWatermark() const override;
  uint32_t writeBufferLowWatermark() const override;
  size_t pendingWriteEntries() const override;
  void write(const message::ResponseEnvelopeSharedPtr& response) override;
  event::Dispatcher& dispatcher() override { return dispatcher_; }
  channel::ChannelSharedPtr channel() const override;
  void setChannel(channel::ChannelSharedPtr channel) override;
  void addConnectionCallbacks(ConnectionCallbacks& cb) override;
  void removeConnectionCallbacks(ConnectionCallbacks& cb) override;

  /**
   * Throws std::invalid_argument unless 0 < low < high.
   */
  void setWriteBufferWatermarks(uint32_t high_watermark,
                                uint32_t low_watermark);

  // Transport notifications, called on the dispatcher thread

  /**
   * The connection is established; raises ConnectionEvent::Connected
   */
  void onConnected();

  /**
   * The peer closed the connection; raises ConnectionEvent::RemoteClose
   * unless the connection is already closed
   */
  void onRemoteClose();

  /**
   * Bytes and entries left the outbound queue for the socket
   */
  void onWriteComplete(size_t bytes, size_t entries);

 protected:
  ConnectionImplBase(event::Dispatcher& dispatcher, std::string remote_address);

  /**
   * Hand a response to the transport. Returns the number of bytes queued.
   */
  virtual size_t doWrite(const message::ResponseEnvelopeSharedPtr& response) = 0;

  virtual void closeSocket(ConnectionCloseType type) = 0;

  // Transports stop or resume polling the socket for reads here
  virtual void onReadDisableChanged(bool disabled) { (void)disabled; }

  void raiseConnectionEvent(ConnectionEvent event);

 private:
  void onWriteBufferHighWatermark();
  void onWriteBufferLowWatermark();
  void markClosedAndDetach();

  static std::atomic<uint64_t> next_connection_id_;

  event::Dispatcher& dispatcher_;
  const uint64_t id_;
  const std::string remote_address_;
  std::atomic<ConnectionState> state_{ConnectionState::Open};
  std::atomic<bool> read_enabled_{true};
  WriteBufferWatermark write_buffer_;
  std::vector<ConnectionCallbacks*> callbacks_;

  mutable std::mutex channel_mutex_;
  channel::ChannelSharedPtr channel_;
};

}  // namespace network
}  // namespace acceptor

#endif  // ACCEPTOR_NETWORK_CONNECTION_IMPL_H
