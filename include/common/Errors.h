#pragma once

#include <stdexcept>
#include <string>

namespace stockcast {

enum class ErrorKind {
    INSUFFICIENT_HISTORY,
    MODEL_NOT_FOUND,
    CORRUPT_ARTIFACT,
    FEATURE_MISMATCH,
    DATA_UNAVAILABLE
};

// "InsufficientHistoryError" 형태의 이름 (wire format의 error 필드)
std::string toString(ErrorKind kind);

// Base of every failure that terminates a prediction request.
class PredictionError : public std::runtime_error {
public:
    PredictionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InsufficientHistoryError : public PredictionError {
public:
    explicit InsufficientHistoryError(const std::string& message)
        : PredictionError(ErrorKind::INSUFFICIENT_HISTORY, message) {}
};

class ModelNotFoundError : public PredictionError {
public:
    explicit ModelNotFoundError(const std::string& message)
        : PredictionError(ErrorKind::MODEL_NOT_FOUND, message) {}
};

class CorruptArtifactError : public PredictionError {
public:
    explicit CorruptArtifactError(const std::string& message)
        : PredictionError(ErrorKind::CORRUPT_ARTIFACT, message) {}
};

class FeatureMismatchError : public PredictionError {
public:
    explicit FeatureMismatchError(const std::string& message)
        : PredictionError(ErrorKind::FEATURE_MISMATCH, message) {}
};

class DataUnavailableError : public PredictionError {
public:
    explicit DataUnavailableError(const std::string& message)
        : PredictionError(ErrorKind::DATA_UNAVAILABLE, message) {}
};

} // namespace stockcast
