#ifndef ACCEPTOR_FAULT_FAULT_H
#define ACCEPTOR_FAULT_FAULT_H

#include <exception>
#include <string>
#include <system_error>
#include <variant>

namespace acceptor {
namespace fault {

/**
 * Fault categories surfacing from a connection pipeline
 */
enum class FaultCategory {
  Signal,       // Internal control-flow exception escaped the pipeline
  TransportIo,  // Socket read/write failure
  Unclassified  // Anything else
};

/**
 * What the acceptor does with a fault
 */
enum class FaultAction {
  Close,   // Force the connection closed
  LogOnly  // Report and keep the connection
};

struct SignalFault {
  std::string name;
};

struct TransportIoFault {
  std::error_code code;
  std::string message;
};

struct UnclassifiedFault {
  std::string type;
  std::string message;
};

/**
 * A classified runtime error.
 *
 * The detail is a tagged union over the three categories; the original
 * exception is kept so processors can rethrow or inspect it.
 */
class Fault {
 public:
  using Detail = std::variant<SignalFault, TransportIoFault, UnclassifiedFault>;

  /**
   * Classify an in-flight exception. Non-std::exception throws become
   * unclassified faults.
   */
  static Fault capture(std::exception_ptr exception);

  /**
   * Classify the exception currently being handled. Only valid inside a
   * catch block.
   */
  static Fault current() { return capture(std::current_exception()); }

  FaultCategory category() const;
  const Detail& detail() const { return detail_; }
  std::exception_ptr exception() const { return exception_; }

  /**
   * One line summary, e.g. "IoError: Connection reset by peer"
   */
  std::string describe() const;

  /**
   * Full rendering of the exception and its nested causes, one per line
   */
  std::string trace() const { return trace_; }

 private:
  Fault(Detail detail, std::exception_ptr exception, std::string trace)
      : detail_(std::move(detail)),
        exception_(std::move(exception)),
        trace_(std::move(trace)) {}

  Detail detail_;
  std::exception_ptr exception_;
  std::string trace_;
};

/**
 * Map a fault to the acceptor's recovery policy
 */
FaultAction classify(const Fault& fault);

const char* faultCategoryToString(FaultCategory category);

}  // namespace fault
}  // namespace acceptor

#endif  // ACCEPTOR_FAULT_FAULT_H
