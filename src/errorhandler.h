#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <chrono>
#include <stdexcept>
#include <string>

/**
 * Categories of recoverable failures raised by the comparison pipeline
 */
enum class ErrorType {
    InvalidOptions,
    CanvasError,
    GPUUnavailable,
    GPURenderFailed,
    WorkerInitFailed,
    WorkerCrash,
    WorkerTerminated,
    WorkerSuperseded,
    OutOfMemory,
    Unknown
};

/**
 * Exception carrying an ErrorType alongside the technical message
 */
class DiffException : public std::runtime_error {
public:
    DiffException(ErrorType type, const std::string& message);

    ErrorType type() const { return m_type; }

    /**
     * Get the message meant for end users
     * @return Human readable description of the failure
     */
    std::string userMessage() const;

private:
    ErrorType m_type;
};

/**
 * Classified error record produced by ErrorHandler::handleError
 */
struct AppError {
    ErrorType type = ErrorType::Unknown;
    std::string message;
    std::string userMessage;
    std::string technicalDetails;
    std::string context;
    std::chrono::system_clock::time_point timestamp;
};

class ErrorHandler {
public:
    /**
     * Classify an exception, log it and return the resulting record
     * @param error Exception that was caught
     * @param context Name of the operation that failed
     * @return Classified error
     */
    static AppError handleError(const std::exception& error, const std::string& context = "");

    /**
     * Guess the error category from a free-form message
     * @param message Technical message
     * @return Best matching error type
     */
    static ErrorType detectErrorType(const std::string& message);

    static std::string getUserMessage(ErrorType type);
    static std::string toString(ErrorType type);
};

#endif // ERRORHANDLER_H
