#include "model/Progress.hpp"

namespace rapidcopy::model {

const char* to_string(ErrorRecord::Phase phase) {
    switch (phase) {
        case ErrorRecord::Phase::Scan:    return "scan";
        case ErrorRecord::Phase::Prepare: return "prepare";
        case ErrorRecord::Phase::Copy:    return "copy";
        case ErrorRecord::Phase::Verify:  return "verify";
    }
    return "unknown";
}

const char* to_string(CopyStatus status) {
    switch (status) {
        case CopyStatus::Copied:   return "copied";
        case CopyStatus::Failed:   return "failed";
        case CopyStatus::Canceled: return "canceled";
    }
    return "unknown";
}

std::string ErrorRecord::describe() const {
    std::string text = to_string(phase);
    text += ": ";
    text += path.string();
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    if (code) {
        text += ": ";
        text += code.message();
    }
    return text;
}

}  // namespace rapidcopy::model
