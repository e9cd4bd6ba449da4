/**
 * @file error.hpp
 * @brief Error codes, exception hierarchy and result types for warden
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace warden {

/**
 * @brief Error codes for programmatic error handling
 *
 * The thousands digit groups codes by the category returned from
 * classify().
 */
enum class WardenErrorCode : uint32_t {
  SUCCESS = 0,
  MALFORMED_TOKEN = 1000,
  INVALID_BASE64 = 1001,
  INVALID_CBOR = 1002,
  INVALID_SIGNATURE = 2000,
  TOKEN_TAMPERED = 2001,
  UNKNOWN_KEY_GENERATION = 2002,
  INTEGRITY_CHECK_FAILED = 2003,
  TOKEN_EXPIRED = 3000,
  TOKEN_REVOKED = 3001,
  DEVICE_MISMATCH = 3002,
  UNSUPPORTED_ALGORITHM = 4000,
  ALGORITHM_DOWNGRADE = 4001,
  WEAK_SECRET = 5000,
  KEY_UNAVAILABLE = 5001,
  REVOCATION_UNAVAILABLE = 5002,
  CRYPTO_OPERATION_FAILED = 5003,
  CONFIG_ERROR = 5004,
  CLAIM_TOO_LARGE = 6000,
  INVALID_ARGUMENT = 6001,
  OS_ERROR = 7000,
  MEMORY_ERROR = 7001,
  IO_ERROR = 7002,
  PERMISSION_ERROR = 7003,
  RESOURCE_EXHAUSTED = 7004,
  SYSTEM_CALL_FAILED = 7005
};

/// Kind of a validation or issuance rejection
using ErrorKind = WardenErrorCode;

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(WardenErrorCode code) noexcept {
  switch (code) {
    case WardenErrorCode::SUCCESS:
      return "Success";
    case WardenErrorCode::MALFORMED_TOKEN:
      return "Malformed token";
    case WardenErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case WardenErrorCode::INVALID_CBOR:
      return "Invalid CBOR encoding";
    case WardenErrorCode::INVALID_SIGNATURE:
      return "Invalid signature";
    case WardenErrorCode::TOKEN_TAMPERED:
      return "Token payload has been tampered with";
    case WardenErrorCode::UNKNOWN_KEY_GENERATION:
      return "Unknown key generation";
    case WardenErrorCode::INTEGRITY_CHECK_FAILED:
      return "Integrity check failed";
    case WardenErrorCode::TOKEN_EXPIRED:
      return "Token has expired";
    case WardenErrorCode::TOKEN_REVOKED:
      return "Token has been revoked";
    case WardenErrorCode::DEVICE_MISMATCH:
      return "Device binding mismatch";
    case WardenErrorCode::UNSUPPORTED_ALGORITHM:
      return "Unsupported algorithm";
    case WardenErrorCode::ALGORITHM_DOWNGRADE:
      return "Algorithm downgrade detected";
    case WardenErrorCode::WEAK_SECRET:
      return "Master secret is too weak";
    case WardenErrorCode::KEY_UNAVAILABLE:
      return "No current key generation available";
    case WardenErrorCode::REVOCATION_UNAVAILABLE:
      return "Revocation store unavailable";
    case WardenErrorCode::CRYPTO_OPERATION_FAILED:
      return "Cryptographic operation failed";
    case WardenErrorCode::CONFIG_ERROR:
      return "Invalid configuration";
    case WardenErrorCode::CLAIM_TOO_LARGE:
      return "Custom claims exceed size limit";
    case WardenErrorCode::INVALID_ARGUMENT:
      return "Invalid argument";
    case WardenErrorCode::OS_ERROR:
      return "Operating system error";
    case WardenErrorCode::MEMORY_ERROR:
      return "Memory allocation error";
    case WardenErrorCode::IO_ERROR:
      return "Input/output error";
    case WardenErrorCode::PERMISSION_ERROR:
      return "Permission denied";
    case WardenErrorCode::RESOURCE_EXHAUSTED:
      return "System resource exhausted";
    case WardenErrorCode::SYSTEM_CALL_FAILED:
      return "System call failed";
    default:
      return "Unknown error";
  }
}

/**
 * @brief How a rejection is surfaced by the calling layer
 */
enum class ErrorCategory {
  None,               ///< Not an error
  Untrustworthy,      ///< Token cannot be trusted (signature, tamper, format)
  Lifecycle,          ///< Expired, revoked or bound to another device
  SecurityViolation,  ///< Unsupported algorithm or downgrade attempt
  ServerError,        ///< Not attributable to the caller
  CallerError         ///< Bad issuance request
};

/**
 * @brief Map an error code to its category
 */
constexpr ErrorCategory classify(WardenErrorCode code) noexcept {
  switch (code) {
    case WardenErrorCode::SUCCESS:
      return ErrorCategory::None;
    case WardenErrorCode::MALFORMED_TOKEN:
    case WardenErrorCode::INVALID_BASE64:
    case WardenErrorCode::INVALID_CBOR:
    case WardenErrorCode::INVALID_SIGNATURE:
    case WardenErrorCode::TOKEN_TAMPERED:
    case WardenErrorCode::UNKNOWN_KEY_GENERATION:
    case WardenErrorCode::INTEGRITY_CHECK_FAILED:
      return ErrorCategory::Untrustworthy;
    case WardenErrorCode::TOKEN_EXPIRED:
    case WardenErrorCode::TOKEN_REVOKED:
    case WardenErrorCode::DEVICE_MISMATCH:
      return ErrorCategory::Lifecycle;
    case WardenErrorCode::UNSUPPORTED_ALGORITHM:
    case WardenErrorCode::ALGORITHM_DOWNGRADE:
      return ErrorCategory::SecurityViolation;
    case WardenErrorCode::CLAIM_TOO_LARGE:
    case WardenErrorCode::INVALID_ARGUMENT:
      return ErrorCategory::CallerError;
    default:
      return ErrorCategory::ServerError;
  }
}

/**
 * @brief Message safe to return to a client for any rejection
 *
 * Lifecycle rejections may prompt re-authentication; everything else is
 * reported identically so the response is not an oracle for which check
 * failed.
 */
constexpr std::string_view publicMessage(WardenErrorCode code) noexcept {
  switch (classify(code)) {
    case ErrorCategory::None:
      return "ok";
    case ErrorCategory::Lifecycle:
      return "unauthenticated: session no longer valid";
    case ErrorCategory::CallerError:
      return "invalid token request";
    case ErrorCategory::ServerError:
      return "internal error";
    default:
      return "unauthenticated";
  }
}

/**
 * @brief Base exception class for all warden errors
 */
class WardenError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit WardenError(WardenErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   */
  [[nodiscard]] WardenErrorCode errorCode() const noexcept {
    return error_code_;
  }

  [[nodiscard]] ErrorCategory category() const noexcept {
    return classify(error_code_);
  }

 private:
  WardenErrorCode error_code_;
};

class MalformedTokenError : public WardenError {
 public:
  explicit MalformedTokenError(std::string_view details = {})
      : WardenError(WardenErrorCode::MALFORMED_TOKEN,
                    details.empty() ? std::string()
                                    : std::string("Malformed token: ") +
                                          std::string(details)) {}
};

class InvalidBase64Error : public WardenError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : WardenError(
            WardenErrorCode::INVALID_BASE64,
            std::string("Invalid base64 encoding: ") + std::string(details)) {}
};

class InvalidCborError : public WardenError {
 public:
  explicit InvalidCborError(std::string_view details)
      : WardenError(
            WardenErrorCode::INVALID_CBOR,
            std::string("Invalid CBOR encoding: ") + std::string(details)) {}
};

class InvalidSignatureError : public WardenError {
 public:
  InvalidSignatureError() : WardenError(WardenErrorCode::INVALID_SIGNATURE) {}
};

/**
 * @brief Authenticated decryption failed: ciphertext, nonce or tag altered
 */
class IntegrityError : public WardenError {
 public:
  IntegrityError() : WardenError(WardenErrorCode::INTEGRITY_CHECK_FAILED) {}
};

/**
 * @brief The encrypted payload of a correctly signed token did not decrypt
 */
class TokenTamperedError : public WardenError {
 public:
  TokenTamperedError() : WardenError(WardenErrorCode::TOKEN_TAMPERED) {}
};

class UnknownKeyGenerationError : public WardenError {
 public:
  explicit UnknownKeyGenerationError(uint64_t generation)
      : WardenError(WardenErrorCode::UNKNOWN_KEY_GENERATION,
                    "Unknown key generation: " + std::to_string(generation)),
        generation_(generation) {}

  [[nodiscard]] uint64_t generation() const noexcept { return generation_; }

 private:
  uint64_t generation_;
};

class TokenExpiredError : public WardenError {
 public:
  TokenExpiredError() : WardenError(WardenErrorCode::TOKEN_EXPIRED) {}
};

class TokenRevokedError : public WardenError {
 public:
  TokenRevokedError() : WardenError(WardenErrorCode::TOKEN_REVOKED) {}
};

class DeviceMismatchError : public WardenError {
 public:
  DeviceMismatchError() : WardenError(WardenErrorCode::DEVICE_MISMATCH) {}
};

class UnsupportedAlgorithmError : public WardenError {
 public:
  explicit UnsupportedAlgorithmError(std::string_view algorithm)
      : WardenError(
            WardenErrorCode::UNSUPPORTED_ALGORITHM,
            std::string("Unsupported algorithm: ") + std::string(algorithm)) {}
};

class AlgorithmDowngradeError : public WardenError {
 public:
  AlgorithmDowngradeError(std::string_view presented, std::string_view expected)
      : WardenError(WardenErrorCode::ALGORITHM_DOWNGRADE,
                    std::string("Algorithm downgrade: header names ") +
                        std::string(presented) + ", key generation expects " +
                        std::string(expected)) {}
};

class WeakSecretError : public WardenError {
 public:
  explicit WeakSecretError(std::string_view details)
      : WardenError(WardenErrorCode::WEAK_SECRET,
                    std::string("Weak master secret: ") + std::string(details)) {
  }
};

class KeyUnavailableError : public WardenError {
 public:
  KeyUnavailableError() : WardenError(WardenErrorCode::KEY_UNAVAILABLE) {}
};

class RevocationUnavailableError : public WardenError {
 public:
  explicit RevocationUnavailableError(std::string_view details)
      : WardenError(WardenErrorCode::REVOCATION_UNAVAILABLE,
                    std::string("Revocation store unavailable: ") +
                        std::string(details)) {}
};

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public WardenError {
 public:
  explicit CryptoError(std::string_view details)
      : WardenError(WardenErrorCode::CRYPTO_OPERATION_FAILED,
                    std::string("Cryptographic operation failed: ") +
                        std::string(details)) {}
};

class ConfigError : public WardenError {
 public:
  explicit ConfigError(std::string_view details)
      : WardenError(WardenErrorCode::CONFIG_ERROR,
                    std::string("Invalid configuration: ") +
                        std::string(details)) {}
};

class ClaimTooLargeError : public WardenError {
 public:
  ClaimTooLargeError(size_t actual, size_t limit)
      : WardenError(WardenErrorCode::CLAIM_TOO_LARGE,
                    "Custom claims are " + std::to_string(actual) +
                        " bytes, limit is " + std::to_string(limit)) {}
};

class InvalidArgumentError : public WardenError {
 public:
  explicit InvalidArgumentError(std::string_view details)
      : WardenError(WardenErrorCode::INVALID_ARGUMENT,
                    std::string("Invalid argument: ") + std::string(details)) {
  }
};

/**
 * @brief Exception for OS-related errors
 */
class OsError : public WardenError {
 public:
  explicit OsError(std::string_view details)
      : WardenError(
            WardenErrorCode::OS_ERROR,
            std::string("Operating system error: ") + std::string(details)) {}
};

class MemoryError : public WardenError {
 public:
  explicit MemoryError(std::string_view details)
      : WardenError(
            WardenErrorCode::MEMORY_ERROR,
            std::string("Memory allocation error: ") + std::string(details)) {}
};

class IoError : public WardenError {
 public:
  explicit IoError(std::string_view details)
      : WardenError(WardenErrorCode::IO_ERROR,
                    std::string("Input/output error: ") + std::string(details)) {
  }
};

class PermissionError : public WardenError {
 public:
  explicit PermissionError(std::string_view details)
      : WardenError(WardenErrorCode::PERMISSION_ERROR,
                    std::string("Permission denied: ") + std::string(details)) {
  }
};

class ResourceExhaustedError : public WardenError {
 public:
  explicit ResourceExhaustedError(std::string_view details)
      : WardenError(WardenErrorCode::RESOURCE_EXHAUSTED,
                    std::string("System resource exhausted: ") +
                        std::string(details)) {}
};

class SystemCallError : public WardenError {
 public:
  explicit SystemCallError(std::string_view details)
      : WardenError(WardenErrorCode::SYSTEM_CALL_FAILED,
                    std::string("System call failed: ") + std::string(details)) {
  }
};

/**
 * @brief Result type for outcomes that are expected rather than exceptional
 *
 * Holds either a value or the error that would otherwise have been thrown.
 */
template <typename T, typename E = WardenError>
class Result {
 public:
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  static Result success(T value) { return Result(std::move(value)); }
  static Result error(E error) { return Result(std::move(error)); }

  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Value access (throws the stored error if this is a failure)
  const T& value() const& {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T& value() & {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::move(std::get<T>(data_));
  }

  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

  /**
   * @brief Error code of a failed result, SUCCESS otherwise
   */
  WardenErrorCode errorCode() const noexcept {
    return isError() ? std::get<E>(data_).errorCode()
                     : WardenErrorCode::SUCCESS;
  }

  template <typename F>
  auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
    if (isSuccess()) {
      return Result<decltype(func(std::declval<T>())), E>::success(
          func(std::get<T>(data_)));
    }
    return Result<decltype(func(std::declval<T>())), E>::error(
        std::get<E>(data_));
  }

 private:
  std::variant<T, E> data_;
};

template <typename T>
using WardenResult = Result<T, WardenError>;

/**
 * @brief Throw the OS exception matching an errno value
 */
inline void throwOsError(const std::string& operation, int error_code = errno) {
  std::string error_msg = std::strerror(error_code);

  switch (error_code) {
    case EACCES:
    case EPERM:
      throw PermissionError(operation + ": " + error_msg);
    case ENOMEM:
      throw MemoryError(operation + ": " + error_msg);
    case EMFILE:
    case ENFILE:
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
      throw ResourceExhaustedError(operation + ": " + error_msg);
    case EIO:
    case ENOENT:
    case EISDIR:
    case ENOTDIR:
      throw IoError(operation + ": " + error_msg);
    default:
      throw SystemCallError(operation + ": " + error_msg);
  }
}

}  // namespace warden
