#ifndef ACCEPTOR_MESSAGE_MESSAGE_H
#define ACCEPTOR_MESSAGE_MESSAGE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "acceptor/message/status.h"

namespace acceptor {
namespace message {

class Message;
class RequestEnvelope;
class ResponseEnvelope;

using MessageSharedPtr = std::shared_ptr<Message>;
using RequestEnvelopeSharedPtr = std::shared_ptr<RequestEnvelope>;
using ResponseEnvelopeSharedPtr = std::shared_ptr<ResponseEnvelope>;

/**
 * Base of every object the frame decoder hands to the acceptor.
 *
 * A message owns a payload buffer. release() frees it; the first call
 * returns true and later calls are no-ops returning false.
 */
class Message {
 public:
  virtual ~Message() = default;

  /**
   * Name used when logging unexpected message types
   */
  virtual const char* typeName() const = 0;

  bool release();
  bool released() const { return released_.load(std::memory_order_acquire); }

  const std::vector<uint8_t>& payload() const { return payload_; }
  size_t payloadSize() const { return payload_.size(); }

 protected:
  Message() = default;
  explicit Message(std::vector<uint8_t> payload)
      : payload_(std::move(payload)) {}

  // Frees resources beyond the payload; called once from release()
  virtual void onRelease() {}

 private:
  std::vector<uint8_t> payload_;
  std::atomic<bool> released_{false};
};

/**
 * Raw frame bytes that were not decoded into a request
 */
class BytesMessage : public Message {
 public:
  explicit BytesMessage(std::vector<uint8_t> bytes)
      : Message(std::move(bytes)) {}

  const char* typeName() const override { return "BytesMessage"; }
};

/**
 * A decoded inbound request
 */
class RequestEnvelope : public Message {
 public:
  RequestEnvelope(uint64_t invoke_id,
                  uint8_t serializer_code,
                  std::vector<uint8_t> bytes)
      : Message(std::move(bytes)),
        invoke_id_(invoke_id),
        serializer_code_(serializer_code),
        timestamp_(std::chrono::steady_clock::now()) {}

  const char* typeName() const override { return "RequestEnvelope"; }

  uint64_t invokeId() const { return invoke_id_; }
  uint8_t serializerCode() const { return serializer_code_; }

  // Arrival time, for processor side timeout accounting
  std::chrono::steady_clock::time_point timestamp() const {
    return timestamp_;
  }

 private:
  const uint64_t invoke_id_;
  const uint8_t serializer_code_;
  const std::chrono::steady_clock::time_point timestamp_;
};

/**
 * An outbound reply, matched to its request by invoke id
 */
class ResponseEnvelope {
 public:
  ResponseEnvelope(uint64_t invoke_id,
                   Status status,
                   uint8_t serializer_code,
                   std::vector<uint8_t> bytes)
      : invoke_id_(invoke_id),
        status_(status),
        serializer_code_(serializer_code),
        bytes_(std::move(bytes)) {}

  uint64_t invokeId() const { return invoke_id_; }
  Status status() const { return status_; }
  uint8_t serializerCode() const { return serializer_code_; }
  const std::vector<uint8_t>& bytes() const { return bytes_; }

 private:
  uint64_t invoke_id_;
  Status status_;
  uint8_t serializer_code_;
  std::vector<uint8_t> bytes_;
};

}  // namespace message
}  // namespace acceptor

#endif  // ACCEPTOR_MESSAGE_MESSAGE_H
