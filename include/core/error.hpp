#pragma once

#include <boost/system/error_code.hpp>
#include <expected>
#include <string>
#include <string_view>

// Error taxonomy shared by every layer. Low-level failures (errno, asio,
// libssh2) are translated into one of these kinds at the adapter boundary.
enum class ErrorKind {
  kNotFound,
  kAuthentication,
  kConnection,
  kTimeout,
  kCapacity,
  kIntegrity,
  kTransfer,
  kInvalidArgument,
  kConflict,
};

struct Error {
  ErrorKind kind;
  std::string message;
};

template <typename T> using Result = std::expected<T, Error>;
using Status = Result<void>;

inline std::unexpected<Error> MakeError(ErrorKind kind, std::string message) {
  return std::unexpected(Error{kind, std::move(message)});
}

inline Status MakeStatus(const boost::system::error_code &ec,
                         ErrorKind kind = ErrorKind::kConnection) {
  if (ec) {
    return MakeError(kind, ec.message());
  }
  return {};
}

inline std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNotFound:
    return "NotFound";
  case ErrorKind::kAuthentication:
    return "AuthenticationError";
  case ErrorKind::kConnection:
    return "ConnectionError";
  case ErrorKind::kTimeout:
    return "TimeoutError";
  case ErrorKind::kCapacity:
    return "CapacityError";
  case ErrorKind::kIntegrity:
    return "IntegrityError";
  case ErrorKind::kTransfer:
    return "TransferError";
  case ErrorKind::kInvalidArgument:
    return "InvalidArgument";
  case ErrorKind::kConflict:
    return "Conflict";
  }
  return "Unknown";
}

// Stable mapping used by the HTTP front end.
inline unsigned HttpStatusFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNotFound:
    return 404;
  case ErrorKind::kAuthentication:
    return 401;
  case ErrorKind::kConnection:
    return 502;
  case ErrorKind::kTimeout:
    return 504;
  case ErrorKind::kCapacity:
    return 503;
  case ErrorKind::kIntegrity:
    return 422;
  case ErrorKind::kTransfer:
    return 500;
  case ErrorKind::kInvalidArgument:
    return 400;
  case ErrorKind::kConflict:
    return 409;
  }
  return 500;
}
