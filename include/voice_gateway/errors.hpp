#pragma once

#include <stdexcept>
#include <string>

namespace voice_gateway {

// Failures raised by pipeline stages. Recognition and synthesis failures are
// absorbed where they occur; the others reach the session manager.
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

class RecognitionFailure : public PipelineError {
public:
    explicit RecognitionFailure(const std::string& message) : PipelineError(message) {}
};

class BackendUnavailable : public PipelineError {
public:
    explicit BackendUnavailable(const std::string& message) : PipelineError(message) {}
};

class SynthesisFailure : public PipelineError {
public:
    explicit SynthesisFailure(const std::string& message) : PipelineError(message) {}
};

class TransportLost : public PipelineError {
public:
    explicit TransportLost(const std::string& message) : PipelineError(message) {}
};

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message) : BackendError(message) {}
};

// The request never reached the backend (refused, reset, DNS, TLS).
class BackendConnectionError : public BackendError {
public:
    explicit BackendConnectionError(const std::string& message) : BackendError(message) {}
};

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message) : std::runtime_error(message) {}
};

class PoolTimeout : public std::runtime_error {
public:
    explicit PoolTimeout(const std::string& message) : std::runtime_error(message) {}
};

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

class DeadlineExceeded : public std::runtime_error {
public:
    explicit DeadlineExceeded(const std::string& message) : std::runtime_error(message) {}
};

}
