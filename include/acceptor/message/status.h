#ifndef ACCEPTOR_MESSAGE_STATUS_H
#define ACCEPTOR_MESSAGE_STATUS_H

#include <cstdint>

namespace acceptor {
namespace message {

/**
 * Response status codes carried on the wire
 */
enum class Status : uint8_t {
  Ok = 0x20,
  ClientError = 0x30,
  ClientTimeout = 0x31,
  ServerTimeout = 0x32,
  BadRequest = 0x40,
  ServiceNotFound = 0x44,
  ServerError = 0x50,
  ServerBusy = 0x51,
  ServiceExpectedError = 0x52,
  ServiceUnexpectedError = 0x53,
  AppFlowControl = 0x54,
  ProviderFlowControl = 0x55,
  DeserializationFail = 0x56
};

inline const char* statusToString(Status status) {
  switch (status) {
    case Status::Ok: return "OK";
    case Status::ClientError: return "CLIENT_ERROR";
    case Status::ClientTimeout: return "CLIENT_TIMEOUT";
    case Status::ServerTimeout: return "SERVER_TIMEOUT";
    case Status::BadRequest: return "BAD_REQUEST";
    case Status::ServiceNotFound: return "SERVICE_NOT_FOUND";
    case Status::ServerError: return "SERVER_ERROR";
    case Status::ServerBusy: return "SERVER_BUSY";
    case Status::ServiceExpectedError: return "SERVICE_EXPECTED_ERROR";
    case Status::ServiceUnexpectedError: return "SERVICE_UNEXPECTED_ERROR";
    case Status::AppFlowControl: return "APP_FLOW_CONTROL";
    case Status::ProviderFlowControl: return "PROVIDER_FLOW_CONTROL";
    case Status::DeserializationFail: return "DESERIALIZATION_FAIL";
  }
  return "UNKNOWN";
}

}  // namespace message
}  // namespace acceptor

#endif  // ACCEPTOR_MESSAGE_STATUS_H
