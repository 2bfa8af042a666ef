#include "TransferEngine.hpp"

namespace mediagrab {

TransferError::TransferError(Kind kind, const std::string& detail)
    : std::runtime_error(std::string(toString(kind)) + ": " + detail),
      kind_(kind),
      detail_(detail) {}

const char* toString(TransferError::Kind kind) {
  switch (kind) {
    case TransferError::Kind::NetworkError:
      return "network error";
    case TransferError::Kind::DiskFull:
      return "disk full";
    case TransferError::Kind::PermissionDenied:
      return "permission denied";
    case TransferError::Kind::ServerRejectedRange:
      return "server rejected range request";
    case TransferError::Kind::Corrupt:
      return "corrupt download";
  }
  return "transfer error";
}

const char* toString(TransferOutcome outcome) {
  switch (outcome) {
    case TransferOutcome::Completed:
      return "Completed";
    case TransferOutcome::Paused:
      return "Paused";
    case TransferOutcome::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace mediagrab
