#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_INVALID_CONFIGURATION,
    ERR_ALREADY_RUNNING,
    ERR_ALREADY_STOPPED,
    ERR_SAMPLE_DROPPED,
    ERR_UNKNOWN
};

const char* errorCodeToString(ErrorCode code);

// Raised synchronously by SampleLogger::start(); the logger state is unchanged.
class AcquisitionException : public std::exception {
public:
    AcquisitionException(const std::string& msg, ErrorCode code = ERR_INVALID_CONFIGURATION) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~AcquisitionException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};
