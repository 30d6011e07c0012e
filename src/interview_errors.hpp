#ifndef INTERVIEW_ERRORS_HPP
#define INTERVIEW_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base for every error the core surfaces to a client. The status code is the
// HTTP status the web layer answers with.
class InterviewError : public std::runtime_error {
public:
    InterviewError(int status_code, const std::string& message)
        : std::runtime_error(message), status_code_(status_code) {}

    int statusCode() const { return status_code_; }

private:
    int status_code_;
};

class ValidationError : public InterviewError {
public:
    explicit ValidationError(const std::string& message) : InterviewError(400, message) {}
};

// Frame bytes that cannot be decoded into an image. Distinct from "no face".
class InvalidFrameError : public InterviewError {
public:
    explicit InvalidFrameError(const std::string& message) : InterviewError(400, message) {}
};

class ForbiddenError : public InterviewError {
public:
    explicit ForbiddenError(const std::string& message) : InterviewError(403, message) {}
};

class NotFoundError : public InterviewError {
public:
    explicit NotFoundError(const std::string& message) : InterviewError(404, message) {}
};

// Second answer for the same question.
class ConflictError : public InterviewError {
public:
    explicit ConflictError(const std::string& message) : InterviewError(409, message) {}
};

// Any submission against a completed session.
class SessionCompletedError : public InterviewError {
public:
    SessionCompletedError() : InterviewError(409, "Interview session already completed") {}
};

class ServiceBusyError : public InterviewError {
public:
    explicit ServiceBusyError(const std::string& message) : InterviewError(503, message) {}
};

// Raised by the question generator client. Never reaches a caller of the
// engine: the question source catches it and falls back.
class GeneratorError : public std::runtime_error {
public:
    explicit GeneratorError(const std::string& message) : std::runtime_error(message) {}
};

// Raised by persistence backends when a command fails.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

#endif // INTERVIEW_ERRORS_HPP
