#include "domain/Errors.hpp"

namespace domain {

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::DatasetNotFound:
        return "DatasetNotFound";
    case ErrorKind::EmptySeries:
        return "EmptySeries";
    case ErrorKind::FetchFailure:
        return "FetchFailure";
    case ErrorKind::UnsupportedInterval:
        return "UnsupportedInterval";
    case ErrorKind::InsufficientData:
        return "InsufficientData";
    case ErrorKind::InvalidRow:
        return "InvalidRow";
    }
    return "Unknown";
}

PipelineError::PipelineError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(detail.empty() ? std::string{errorKindToString(kind)}
                                        : std::string{errorKindToString(kind)} + ": " + detail),
      kind_(kind) {}

}  // namespace domain
