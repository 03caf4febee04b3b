#ifndef ACCEPTOR_CORE_ERRORS_H
#define ACCEPTOR_CORE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace acceptor {

/**
 * Internal control-flow exception.
 *
 * Raised by pipeline stages (decoder, idle detection) to unwind out of a
 * connection. A Signal reaching the acceptor is never an application error:
 * the connection is closed.
 */
class Signal : public std::exception {
 public:
  Signal(uint32_t id, std::string name) : id_(id), name_(std::move(name)) {}

  uint32_t id() const { return id_; }
  const std::string& name() const { return name_; }

  const char* what() const noexcept override { return name_.c_str(); }

  bool operator==(const Signal& other) const { return id_ == other.id_; }
  bool operator!=(const Signal& other) const { return id_ != other.id_; }

  // Well known signals raised by the frame decoder and idle detection
  static const Signal& illegalMagic();
  static const Signal& illegalSign();
  static const Signal& readerIdle();

 private:
  uint32_t id_;
  std::string name_;
};

/**
 * Socket level read/write failure.
 */
class IoError : public std::system_error {
 public:
  IoError(std::error_code code, const std::string& what)
      : std::system_error(code, what) {}

  explicit IoError(int errno_value, const std::string& what = "")
      : std::system_error(errno_value, std::system_category(), what) {}
};

}  // namespace acceptor

#endif  // ACCEPTOR_CORE_ERRORS_H
