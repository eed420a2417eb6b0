#pragma once

#include <exception>
#include <string>

namespace docchat_core {

/*
Base for every error the engine raises. Carries the originating cause (if any)
so callers can log the full chain before mapping it to a response.
*/
class DocChatError : public std::exception {
 public:
  explicit DocChatError(const std::string &message, std::exception_ptr cause = nullptr)
      : message_(message), cause_(std::move(cause)) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  std::exception_ptr cause() const noexcept {
    return cause_;
  }

  // Message of the wrapped cause, or an empty string when there is none
  std::string cause_message() const {
    if (!cause_) {
      return "";
    }
    try {
      std::rethrow_exception(cause_);
    } catch (const std::exception &e) {
      return e.what();
    } catch (...) {
      return "unknown error";
    }
  }

 private:
  std::string message_;
  std::exception_ptr cause_;
};

// Bad caller-supplied parameters. Never retried.
class ConfigurationError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

class IndexNotFoundError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

class SessionNotFoundError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

// On-disk index exists but cannot be trusted. Fatal for that session.
class IndexCorruptError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

class IndexStorageError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

class InvalidParameterError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

// Orchestrator used out of sequence
class NotInitializedError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

// Provider failure while answering. Safe to retry, invoke mutates nothing.
class GenerationError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

// Provider failure while embedding chunks for ingestion
class IngestionError : public DocChatError {
 public:
  using DocChatError::DocChatError;
};

}  // namespace docchat_core
