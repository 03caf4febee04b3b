#include "acceptor/processor/error_reply_processor.h"

#define ACCEPTOR_LOG_COMPONENT "Processor.error_reply"
#include "acceptor/logging/log_macros.h"

namespace acceptor {
namespace processor {

message::ResponseEnvelopeSharedPtr ErrorReplyProcessor::buildErrorResponse(
    const message::RequestEnvelope& request,
    message::Status status,
    const fault::Fault& fault) {
  std::string text = fault.describe();
  return std::make_shared<message::ResponseEnvelope>(
      request.invokeId(), status, request.serializerCode(),
      std::vector<uint8_t>(text.begin(), text.end()));
}

void ErrorReplyProcessor::handleException(
    const channel::ChannelSharedPtr& channel,
    const message::RequestEnvelopeSharedPtr& request,
    message::Status status,
    const fault::Fault& fault) {
  if (!channel || !request) {
    return;
  }

  try {
    if (!channel->write(buildErrorResponse(*request, status, fault))) {
      ACCEPTOR_LOG_DEBUG("error reply {} for request {} dropped, channel #{} "
                         "detached",
                         message::statusToString(status), request->invokeId(),
                         channel->id());
    }
  } catch (const std::exception& e) {
    ACCEPTOR_LOG_ERROR("failed to write error reply for request {}: {}",
                       request->invokeId(), e.what());
  }
}

}  // namespace processor
}  // namespace acceptor
