#ifndef ACCEPTOR_PROCESSOR_PROVIDER_PROCESSOR_H
#define ACCEPTOR_PROCESSOR_PROVIDER_PROCESSOR_H

#include <memory>

#include "acceptor/channel/channel.h"
#include "acceptor/fault/fault.h"
#include "acceptor/message/message.h"
#include "acceptor/message/status.h"

namespace acceptor {
namespace processor {

/**
 * Request processor plugged into the acceptor.
 *
 * One instance serves every connection and may be called concurrently from
 * all worker threads.
 */
class ProviderProcessor {
 public:
  virtual ~ProviderProcessor() = default;

  /**
   * Process a decoded request. May run the request inline or hand it to an
   * executor. Any exception thrown here is turned into a SERVER_ERROR reply
   * by the acceptor.
   */
  virtual void handleRequest(const channel::ChannelSharedPtr& channel,
                             const message::RequestEnvelopeSharedPtr& request) = 0;

  /**
   * Reply to a request that failed with the given status. Must not throw.
   */
  virtual void handleException(const channel::ChannelSharedPtr& channel,
                               const message::RequestEnvelopeSharedPtr& request,
                               message::Status status,
                               const fault::Fault& fault) = 0;
};

using ProviderProcessorSharedPtr = std::shared_ptr<ProviderProcessor>;

}  // namespace processor
}  // namespace acceptor

#endif  // ACCEPTOR_PROCESSOR_PROVIDER_PROCESSOR_H
