#include "common/Errors.h"

namespace stockcast {

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INSUFFICIENT_HISTORY: return "InsufficientHistoryError";
        case ErrorKind::MODEL_NOT_FOUND:      return "ModelNotFoundError";
        case ErrorKind::CORRUPT_ARTIFACT:     return "CorruptArtifactError";
        case ErrorKind::FEATURE_MISMATCH:     return "FeatureMismatchError";
        case ErrorKind::DATA_UNAVAILABLE:     return "DataUnavailableError";
    }
    return "UnknownError";
}

} // namespace stockcast
