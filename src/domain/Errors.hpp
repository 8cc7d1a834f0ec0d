#pragma once

#include <stdexcept>
#include <string>

namespace domain {

enum class ErrorKind {
    DatasetNotFound,
    EmptySeries,
    FetchFailure,
    UnsupportedInterval,
    InsufficientData,
    InvalidRow,
};

const char* errorKindToString(ErrorKind kind) noexcept;

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace domain
