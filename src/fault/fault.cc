#include "acceptor/fault/fault.h"

#include <cxxabi.h>

#include <cstdlib>
#include <ios>
#include <memory>
#include <sstream>
#include <typeinfo>

#include "acceptor/core/errors.h"

namespace acceptor {
namespace fault {

namespace {

std::string demangle(const char* mangled) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
  return mangled;
}

std::string typeNameOf(const std::exception& e) {
  return demangle(typeid(e).name());
}

// Renders e and each nested cause as "Type: what", indenting causes
void appendTrace(std::ostringstream& oss, const std::exception& e, int depth) {
  if (depth > 0) {
    oss << '\n' << std::string(static_cast<size_t>(depth) * 2, ' ')
        << "caused by: ";
  }
  oss << typeNameOf(e) << ": " << e.what();

  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    appendTrace(oss, nested, depth + 1);
  } catch (...) {
    oss << '\n' << std::string(static_cast<size_t>(depth + 1) * 2, ' ')
        << "caused by: <non-standard exception>";
  }
}

std::string traceOf(const std::exception& e) {
  std::ostringstream oss;
  appendTrace(oss, e, 0);
  return oss.str();
}

}  // namespace

Fault Fault::capture(std::exception_ptr exception) {
  if (!exception) {
    return Fault(UnclassifiedFault{"<none>", "no exception captured"},
                 exception, "<none>: no exception captured");
  }

  try {
    std::rethrow_exception(exception);
  } catch (const Signal& signal) {
    return Fault(SignalFault{signal.name()}, exception, traceOf(signal));
  } catch (const IoError& error) {
    return Fault(TransportIoFault{error.code(), error.what()}, exception,
                 traceOf(error));
  } catch (const std::ios_base::failure& failure) {
    return Fault(TransportIoFault{failure.code(), failure.what()}, exception,
                 traceOf(failure));
  } catch (const std::exception& e) {
    return Fault(UnclassifiedFault{typeNameOf(e), e.what()}, exception,
                 traceOf(e));
  } catch (...) {
    return Fault(UnclassifiedFault{"<unknown>", "non-standard exception"},
                 exception, "<unknown>: non-standard exception");
  }
}

namespace {

struct CategoryOf {
  FaultCategory operator()(const SignalFault&) const {
    return FaultCategory::Signal;
  }
  FaultCategory operator()(const TransportIoFault&) const {
    return FaultCategory::TransportIo;
  }
  FaultCategory operator()(const UnclassifiedFault&) const {
    return FaultCategory::Unclassified;
  }
};

struct ActionOf {
  FaultAction operator()(const SignalFault&) const {
    return FaultAction::Close;
  }
  FaultAction operator()(const TransportIoFault&) const {
    return FaultAction::Close;
  }
  FaultAction operator()(const UnclassifiedFault&) const {
    return FaultAction::LogOnly;
  }
};

struct Describe {
  std::string operator()(const SignalFault& f) const {
    return "Signal: " + f.name;
  }
  std::string operator()(const TransportIoFault& f) const {
    return "IoError: " + f.message;
  }
  std::string operator()(const UnclassifiedFault& f) const {
    return f.type + ": " + f.message;
  }
};

}  // namespace

FaultCategory Fault::category() const {
  return std::visit(CategoryOf{}, detail_);
}

std::string Fault::describe() const { return std::visit(Describe{}, detail_); }

FaultAction classify(const Fault& fault) {
  return std::visit(ActionOf{}, fault.detail());
}

const char* faultCategoryToString(FaultCategory category) {
  switch (category) {
    case FaultCategory::Signal:
      return "signal";
    case FaultCategory::TransportIo:
      return "transport_io";
    case FaultCategory::Unclassified:
      return "unclassified";
  }
  return "unknown";
}

}  // namespace fault
}  // namespace acceptor
