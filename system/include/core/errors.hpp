// ============= include/core/errors.hpp =============
#pragma once
#include <stdexcept>
#include <string>

namespace facematch {

enum class ErrorCode {
    ImageDecodeFailure,
    DetectorUnavailable,
    NoFaceDetected,
    MultipleFacesDetected,
    EmbedderFailure,
    MixedDescriptorKind,
    InvalidEntry,
    HistoryAppendFailure,
    Cancelled,
    StorageFailure,
    DuplicateEmployeeId,
    ConfigError
};

const char* to_string(ErrorCode code);

// Error tipado para toda la llamada. Los fallos por cara no se lanzan:
// se degradan a "unknown" dentro del RecognitionRun.
class RecognitionError : public std::runtime_error {
public:
    RecognitionError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message),
          error_code(code) {}

    ErrorCode code() const noexcept { return error_code; }

private:
    ErrorCode error_code;
};

} // namespace facematch
