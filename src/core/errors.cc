#include "acceptor/core/errors.h"

namespace acceptor {

const Signal& Signal::illegalMagic() {
  static const Signal signal(1, "ILLEGAL_MAGIC");
  return signal;
}

const Signal& Signal::illegalSign() {
  static const Signal signal(2, "ILLEGAL_SIGN");
  return signal;
}

const Signal& Signal::readerIdle() {
  static const Signal signal(3, "READER_IDLE");
  return signal;
}

}  // namespace acceptor
