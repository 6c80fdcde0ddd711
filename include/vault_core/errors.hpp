#pragma once

#include <cstddef>
#include <exception>
#include <string>

namespace vault_core {

enum class ErrorKind {
  DimensionMismatch,
  InvalidEmbeddingValue,
  InvalidIdentifier,
  InvalidMetadataValue,
  EmptyText,
  DuplicateIdentifier,
  InvalidArgument,
  NotOpen,
  Storage
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DimensionMismatch:
      return "DimensionMismatch";
    case ErrorKind::InvalidEmbeddingValue:
      return "InvalidEmbeddingValue";
    case ErrorKind::InvalidIdentifier:
      return "InvalidIdentifier";
    case ErrorKind::InvalidMetadataValue:
      return "InvalidMetadataValue";
    case ErrorKind::EmptyText:
      return "EmptyText";
    case ErrorKind::DuplicateIdentifier:
      return "DuplicateIdentifier";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::NotOpen:
      return "NotOpen";
    case ErrorKind::Storage:
      return "StorageError";
    default:
      return "Unknown";
  }
}

class VaultError : public std::exception {
 public:
  VaultError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

// Record-level failures. Recovered per record in batch mode.
class ValidationError : public VaultError {
 public:
  using VaultError::VaultError;
};

class DimensionMismatchError : public ValidationError {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : ValidationError(ErrorKind::DimensionMismatch,
                        "Embedding dimension mismatch. Expected " + std::to_string(expected) +
                            ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const noexcept {
    return expected_;
  }
  size_t actual() const noexcept {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

class InvalidEmbeddingValueError : public ValidationError {
 public:
  explicit InvalidEmbeddingValueError(const std::string &message)
      : ValidationError(ErrorKind::InvalidEmbeddingValue, message) {}
};

class InvalidIdentifierError : public ValidationError {
 public:
  explicit InvalidIdentifierError(const std::string &message)
      : ValidationError(ErrorKind::InvalidIdentifier, message) {}
};

// Metadata that storage could not read back, such as NaN or infinite numbers.
class InvalidMetadataValueError : public ValidationError {
 public:
  explicit InvalidMetadataValueError(const std::string &message)
      : ValidationError(ErrorKind::InvalidMetadataValue, message) {}
};

class EmptyTextError : public ValidationError {
 public:
  explicit EmptyTextError(const std::string &message)
      : ValidationError(ErrorKind::EmptyText, message) {}
};

class DuplicateIdentifierError : public ValidationError {
 public:
  explicit DuplicateIdentifierError(const std::string &id)
      : ValidationError(ErrorKind::DuplicateIdentifier,
                        "Record with id '" + id + "' already exists") {}
};

class InvalidArgumentError : public VaultError {
 public:
  explicit InvalidArgumentError(const std::string &message)
      : VaultError(ErrorKind::InvalidArgument, message) {}
};

class NotOpenError : public VaultError {
 public:
  explicit NotOpenError(const std::string &operation)
      : VaultError(ErrorKind::NotOpen, operation + " requires an open collection") {}
};

class StorageError : public VaultError {
 public:
  explicit StorageError(const std::string &message) : VaultError(ErrorKind::Storage, message) {}
};

}  // namespace vault_core
