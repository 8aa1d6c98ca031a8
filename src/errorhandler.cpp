#include "errorhandler.h"
#include "performancemonitor.h"
#include <algorithm>
#include <cctype>
#include <new>

DiffException::DiffException(ErrorType type, const std::string& message)
    : std::runtime_error(message), m_type(type) {
}

std::string DiffException::userMessage() const {
    return ErrorHandler::getUserMessage(m_type);
}

AppError ErrorHandler::handleError(const std::exception& error, const std::string& context) {
    AppError result;
    result.message = error.what();
    result.context = context;
    result.timestamp = std::chrono::system_clock::now();

    if (const auto* diffError = dynamic_cast<const DiffException*>(&error)) {
        result.type = diffError->type();
    } else if (dynamic_cast<const std::bad_alloc*>(&error)) {
        result.type = ErrorType::OutOfMemory;
    } else {
        result.type = detectErrorType(result.message);
    }

    result.userMessage = getUserMessage(result.type);
    result.technicalDetails = "[" + toString(result.type) + "] " + result.message;

    std::string logMessage = result.technicalDetails;
    if (!context.empty()) {
        logMessage = context + ": " + logMessage;
    }
    LOG_ERROR("Error", logMessage);

    return result;
}

ErrorType ErrorHandler::detectErrorType(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("out of memory") != std::string::npos ||
        lower.find("insufficient memory") != std::string::npos) {
        return ErrorType::OutOfMemory;
    }
    if (lower.find("canvas") != std::string::npos || lower.find("surface") != std::string::npos) {
        return ErrorType::CanvasError;
    }
    if (lower.find("opencl") != std::string::npos || lower.find("kernel") != std::string::npos) {
        return ErrorType::GPURenderFailed;
    }
    if (lower.find("worker") != std::string::npos) {
        if (lower.find("init") != std::string::npos) {
            return ErrorType::WorkerInitFailed;
        }
        if (lower.find("terminat") != std::string::npos) {
            return ErrorType::WorkerTerminated;
        }
        return ErrorType::WorkerCrash;
    }
    return ErrorType::Unknown;
}

std::string ErrorHandler::getUserMessage(ErrorType type) {
    switch (type) {
        case ErrorType::InvalidOptions:
            return "The comparison settings are out of range.";
        case ErrorType::CanvasError:
            return "Unable to read the page images. Please try again.";
        case ErrorType::GPUUnavailable:
            return "GPU acceleration is not available. Falling back to CPU rendering.";
        case ErrorType::GPURenderFailed:
            return "GPU rendering failed. Falling back to CPU rendering.";
        case ErrorType::WorkerInitFailed:
            return "Background processing is unavailable. Try a smaller image.";
        case ErrorType::WorkerCrash:
            return "Background processing failed. Please try again.";
        case ErrorType::WorkerTerminated:
            return "The comparison was cancelled.";
        case ErrorType::WorkerSuperseded:
            return "The comparison was replaced by a newer request.";
        case ErrorType::OutOfMemory:
            return "Not enough memory to compare these pages. Try a smaller zoom level.";
        case ErrorType::Unknown:
        default:
            return "An unexpected error occurred. Please try again.";
    }
}

std::string ErrorHandler::toString(ErrorType type) {
    switch (type) {
        case ErrorType::InvalidOptions: return "INVALID_OPTIONS";
        case ErrorType::CanvasError: return "CANVAS_ERROR";
        case ErrorType::GPUUnavailable: return "GPU_UNAVAILABLE";
        case ErrorType::GPURenderFailed: return "GPU_RENDER_FAILED";
        case ErrorType::WorkerInitFailed: return "WORKER_INIT_FAILED";
        case ErrorType::WorkerCrash: return "WORKER_CRASH";
        case ErrorType::WorkerTerminated: return "WORKER_TERMINATED";
        case ErrorType::WorkerSuperseded: return "WORKER_SUPERSEDED";
        case ErrorType::OutOfMemory: return "OUT_OF_MEMORY";
        case ErrorType::Unknown:
        default: return "UNKNOWN_ERROR";
    }
}
