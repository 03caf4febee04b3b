#include "acceptor/message/message.h"

namespace acceptor {
namespace message {

bool Message::release() {
  bool expected = false;
  if (!released_.compare_exchange_strong(expected, true,
                                         std::memory_order_acq_rel)) {
    return false;
  }
  std::vector<uint8_t>().swap(payload_);
  onRelease();
  return true;
}

}  // namespace message
}  // namespace acceptor
