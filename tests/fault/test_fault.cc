#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <ios>
#include <stdexcept>

#include "acceptor/core/errors.h"
#include "acceptor/fault/fault.h"

namespace acceptor {
namespace fault {
namespace {

using ::testing::HasSubstr;

template <typename E>
Fault captureThrown(const E& e) {
  try {
    throw e;
  } catch (...) {
    return Fault::current();
  }
}

class DecoderError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

TEST(SignalTest, WellKnownSignals) {
  EXPECT_EQ(Signal::illegalMagic().name(), "ILLEGAL_MAGIC");
  EXPECT_EQ(Signal::illegalSign().name(), "ILLEGAL_SIGN");
  EXPECT_EQ(Signal::readerIdle().name(), "READER_IDLE");

  EXPECT_EQ(Signal::illegalMagic(), Signal::illegalMagic());
  EXPECT_NE(Signal::illegalMagic(), Signal::readerIdle());
  EXPECT_STREQ(Signal::readerIdle().what(), "READER_IDLE");
}

TEST(SignalTest, IdentityIsTheId) {
  Signal copy(Signal::illegalSign().id(), "renamed");
  EXPECT_EQ(copy, Signal::illegalSign());
}

TEST(IoErrorTest, CarriesErrorCode) {
  IoError error(ECONNRESET, "read");
  EXPECT_EQ(error.code().value(), ECONNRESET);
  EXPECT_EQ(error.code().category(), std::system_category());
  EXPECT_THAT(error.what(), HasSubstr("read"));
}

TEST(FaultTest, SignalIsClassifiedAsSignal) {
  Fault fault = captureThrown(Signal::illegalMagic());

  EXPECT_EQ(fault.category(), FaultCategory::Signal);
  EXPECT_EQ(classify(fault), FaultAction::Close);
  ASSERT_TRUE(std::holds_alternative<SignalFault>(fault.detail()));
  EXPECT_EQ(std::get<SignalFault>(fault.detail()).name, "ILLEGAL_MAGIC");
  EXPECT_EQ(fault.describe(), "Signal: ILLEGAL_MAGIC");
}

TEST(FaultTest, IoErrorIsClassifiedAsTransportIo) {
  Fault fault = captureThrown(IoError(ECONNRESET, "read"));

  EXPECT_EQ(fault.category(), FaultCategory::TransportIo);
  EXPECT_EQ(classify(fault), FaultAction::Close);
  const auto& detail = std::get<TransportIoFault>(fault.detail());
  EXPECT_EQ(detail.code.value(), ECONNRESET);
  EXPECT_THAT(fault.trace(), HasSubstr("acceptor::IoError"));
}

TEST(FaultTest, IosFailureIsClassifiedAsTransportIo) {
  Fault fault = captureThrown(std::ios_base::failure("stream broke"));

  EXPECT_EQ(fault.category(), FaultCategory::TransportIo);
  EXPECT_EQ(classify(fault), FaultAction::Close);
}

TEST(FaultTest, OtherExceptionsAreUnclassified) {
  Fault fault = captureThrown(DecoderError("bad frame"));

  EXPECT_EQ(fault.category(), FaultCategory::Unclassified);
  EXPECT_EQ(classify(fault), FaultAction::LogOnly);
  const auto& detail = std::get<UnclassifiedFault>(fault.detail());
  EXPECT_THAT(detail.type, HasSubstr("DecoderError"));
  EXPECT_EQ(detail.message, "bad frame");
  EXPECT_THAT(fault.describe(), HasSubstr("bad frame"));
}

TEST(FaultTest, NonStandardThrowIsUnclassified) {
  Fault fault = captureThrown(42);

  EXPECT_EQ(fault.category(), FaultCategory::Unclassified);
  EXPECT_EQ(classify(fault), FaultAction::LogOnly);
  EXPECT_TRUE(static_cast<bool>(fault.exception()));
  EXPECT_THAT(fault.trace(), HasSubstr("non-standard"));
}

TEST(FaultTest, NullExceptionIsUnclassified) {
  Fault fault = Fault::capture(nullptr);

  EXPECT_EQ(fault.category(), FaultCategory::Unclassified);
  EXPECT_FALSE(static_cast<bool>(fault.exception()));
}

TEST(FaultTest, TraceIncludesNestedCauses) {
  Fault fault = [] {
    try {
      try {
        throw IoError(EPIPE, "write");
      } catch (...) {
        std::throw_with_nested(std::runtime_error("reply failed"));
      }
    } catch (...) {
      return Fault::current();
    }
    return Fault::capture(nullptr);
  }();

  // Classified by the outermost exception
  EXPECT_EQ(fault.category(), FaultCategory::Unclassified);
  EXPECT_THAT(fault.trace(), HasSubstr("reply failed"));
  EXPECT_THAT(fault.trace(), HasSubstr("caused by: acceptor::IoError"));
}

TEST(FaultTest, OriginalExceptionCanBeRethrown) {
  Fault fault = captureThrown(DecoderError("again"));

  EXPECT_THROW(std::rethrow_exception(fault.exception()), DecoderError);
}

TEST(FaultTest, CategoryNames) {
  EXPECT_STREQ(faultCategoryToString(FaultCategory::Signal), "signal");
  EXPECT_STREQ(faultCategoryToString(FaultCategory::TransportIo),
               "transport_io");
  EXPECT_STREQ(faultCategoryToString(FaultCategory::Unclassified),
               "unclassified");
}

}  // namespace
}  // namespace fault
}  // namespace acceptor
