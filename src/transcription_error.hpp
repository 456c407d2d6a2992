#pragma once

#include <string_view>

enum class TranscriptionError {
    InstanceBusy,
    InvalidInput,
    Cancelled,
    NotInProgress,
    CancellationAlreadyPending,
};

inline std::string_view error_message(TranscriptionError err) {
    switch (err) {
        case TranscriptionError::InstanceBusy:
            return "a transcription is already in progress";
        case TranscriptionError::InvalidInput:
            return "no audio samples";
        case TranscriptionError::Cancelled:
            return "transcription cancelled";
        case TranscriptionError::NotInProgress:
            return "no transcription in progress";
        case TranscriptionError::CancellationAlreadyPending:
            return "cancellation already pending";
    }
    return "unknown error";
}
