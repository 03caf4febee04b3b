#ifndef ACCEPTOR_SERVER_ACCEPTOR_CONNECTION_CALLBACKS_H
#define ACCEPTOR_SERVER_ACCEPTOR_CONNECTION_CALLBACKS_H

#include <exception>
#include <memory>

#include "acceptor/network/connection.h"
#include "acceptor/server/acceptor_handler.h"

namespace acceptor {
namespace server {

class AcceptorConnectionCallbacks;
using AcceptorConnectionCallbacksPtr =
    std::unique_ptr<AcceptorConnectionCallbacks>;

/**
 * Binds one connection to the shared AcceptorHandler.
 *
 * Translates connection events into handler entry points: Connected becomes
 * onConnect, the first close event becomes onDisconnect and watermark
 * crossings become onWritabilityChanged. The transport feeds decoded
 * messages and pipeline exceptions through onMessage() and onFault().
 *
 * The owner must keep this object alive until the connection is closed or
 * the callbacks are removed.
 */
class AcceptorConnectionCallbacks : public network::ConnectionCallbacks {
 public:
  AcceptorConnectionCallbacks(AcceptorHandler& handler,
                              const network::ConnectionSharedPtr& connection);
  ~AcceptorConnectionCallbacks() override;

  /**
   * Create callbacks for connection and register them on it
   */
  static AcceptorConnectionCallbacksPtr install(
      AcceptorHandler& handler, const network::ConnectionSharedPtr& connection);

  // network::ConnectionCallbacks
  void onEvent(network::ConnectionEvent event) override;
  void onAboveWriteBufferHighWatermark() override;
  void onBelowWriteBufferLowWatermark() override;

  // Transport side entry points
  void onMessage(const message::MessageSharedPtr& msg);
  void onFault(std::exception_ptr exception);

  bool connected() const { return connected_; }
  bool disconnected() const { return disconnected_; }

 private:
  AcceptorHandler& handler_;
  network::ConnectionWeakPtr connection_;
  network::Connection* raw_connection_;
  bool registered_{false};
  bool connected_{false};
  bool disconnected_{false};
};

}  // namespace server
}  // namespace acceptor

#endif  // ACCEPTOR_SERVER_ACCEPTOR_CONNECTION_CALLBACKS_H
