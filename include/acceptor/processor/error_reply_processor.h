#ifndef ACCEPTOR_PROCESSOR_ERROR_REPLY_PROCESSOR_H
#define ACCEPTOR_PROCESSOR_ERROR_REPLY_PROCESSOR_H

#include "acceptor/processor/provider_processor.h"

namespace acceptor {
namespace processor {

/**
 * Processor base that answers failed requests with an error response.
 *
 * The response carries the request's invoke id and serializer code, the
 * status and the fault description as payload. The write is
 * fire-and-forget.
 */
class ErrorReplyProcessor : public ProviderProcessor {
 public:
  void handleException(const channel::ChannelSharedPtr& channel,
                       const message::RequestEnvelopeSharedPtr& request,
                       message::Status status,
                       const fault::Fault& fault) override;

  /**
   * Build the error response written by handleException()
   */
  static message::ResponseEnvelopeSharedPtr buildErrorResponse(
      const message::RequestEnvelope& request,
      message::Status status,
      const fault::Fault& fault);
};

}  // namespace processor
}  // namespace acceptor

#endif  // ACCEPTOR_PROCESSOR_ERROR_REPLY_PROCESSOR_H
