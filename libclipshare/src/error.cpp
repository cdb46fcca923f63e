/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "clipshare/error.h"
#include <sstream>

namespace clipshare {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::UtilityUnavailable:
    return "UtilityUnavailable";
  case ErrorCode::ExternalProcessError:
    return "ExternalProcessError";
  case ErrorCode::EncodingError:
    return "EncodingError";

  case ErrorCode::NetworkSendError:
    return "NetworkSendError";
  case ErrorCode::BindFailed:
    return "BindFailed";
  case ErrorCode::ConnectionClosed:
    return "ConnectionClosed";
  case ErrorCode::InvalidRequest:
    return "InvalidRequest";

  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::FileReadError:
    return "FileReadError";
  case ErrorCode::FileWriteError:
    return "FileWriteError";

  case ErrorCode::ConfigParseError:
    return "ConfigParseError";
  case ErrorCode::ConfigInvalid:
    return "ConfigInvalid";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::UtilityUnavailable:
    return "Clipboard access unavailable";
  case ErrorCode::ExternalProcessError:
    return "Clipboard helper process failed";
  case ErrorCode::EncodingError:
    return "Malformed encoded clipboard data";

  case ErrorCode::NetworkSendError:
    return "Failed to send to client";
  case ErrorCode::BindFailed:
    return "Failed to bind listening socket";
  case ErrorCode::ConnectionClosed:
    return "Connection is closed";
  case ErrorCode::InvalidRequest:
    return "Malformed request";

  case ErrorCode::FileNotFound:
    return "File not found";
  case ErrorCode::FileReadError:
    return "Error reading file";
  case ErrorCode::FileWriteError:
    return "Error writing file";

  case ErrorCode::ConfigParseError:
    return "Settings file could not be parsed";
  case ErrorCode::ConfigInvalid:
    return "Settings value out of range";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Permanent until restart
  case ErrorCode::NotSupported:
  case ErrorCode::UtilityUnavailable:
    return false;

  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace clipshare
