#include <gtest/gtest.h>
#include <limits>
#include <new>
#include "diffoptions.h"
#include "errorhandler.h"

TEST(ErrorHandlerTest, DiffExceptionKeepsItsType)
{
    DiffException error(ErrorType::WorkerTerminated, "stopped");
    AppError handled = ErrorHandler::handleError(error, "compareAsync");

    EXPECT_EQ(handled.type, ErrorType::WorkerTerminated);
    EXPECT_EQ(handled.message, "stopped");
    EXPECT_EQ(handled.context, "compareAsync");
    EXPECT_EQ(handled.userMessage, ErrorHandler::getUserMessage(ErrorType::WorkerTerminated));
    EXPECT_EQ(handled.technicalDetails, "[WORKER_TERMINATED] stopped");
}

TEST(ErrorHandlerTest, BadAllocIsOutOfMemory)
{
    std::bad_alloc error;
    EXPECT_EQ(ErrorHandler::handleError(error).type, ErrorType::OutOfMemory);
}

TEST(ErrorHandlerTest, MessagesAreClassifiedByKeyword)
{
    EXPECT_EQ(ErrorHandler::detectErrorType("OpenCL kernel build failed"), ErrorType::GPURenderFailed);
    EXPECT_EQ(ErrorHandler::detectErrorType("Failed to get canvas contexts"), ErrorType::CanvasError);
    EXPECT_EQ(ErrorHandler::detectErrorType("Worker initialization failed"), ErrorType::WorkerInitFailed);
    EXPECT_EQ(ErrorHandler::detectErrorType("Worker terminated"), ErrorType::WorkerTerminated);
    EXPECT_EQ(ErrorHandler::detectErrorType("worker exploded"), ErrorType::WorkerCrash);
    EXPECT_EQ(ErrorHandler::detectErrorType("Out of memory while resizing"), ErrorType::OutOfMemory);
    EXPECT_EQ(ErrorHandler::detectErrorType("something odd"), ErrorType::Unknown);
}

TEST(ErrorHandlerTest, RuntimeErrorsAreClassified)
{
    std::runtime_error error("clEnqueueNDRangeKernel failed");
    EXPECT_EQ(ErrorHandler::handleError(error).type, ErrorType::GPURenderFailed);
}

TEST(ErrorHandlerTest, EveryTypeHasNameAndMessage)
{
    for (ErrorType type : {ErrorType::InvalidOptions, ErrorType::CanvasError, ErrorType::GPUUnavailable,
                           ErrorType::GPURenderFailed, ErrorType::WorkerInitFailed, ErrorType::WorkerCrash,
                           ErrorType::WorkerTerminated, ErrorType::WorkerSuperseded, ErrorType::OutOfMemory,
                           ErrorType::Unknown}) {
        EXPECT_FALSE(ErrorHandler::toString(type).empty());
        EXPECT_FALSE(ErrorHandler::getUserMessage(type).empty());
    }
    EXPECT_EQ(ErrorHandler::toString(ErrorType::WorkerCrash), "WORKER_CRASH");
    EXPECT_EQ(ErrorHandler::toString(ErrorType::Unknown), "UNKNOWN_ERROR");
}

TEST(DiffOptionsTest, DefaultsAreValid)
{
    DiffOptions options;

    EXPECT_EQ(options.mode, DiffMode::Pixel);
    EXPECT_DOUBLE_EQ(options.threshold, 10.0);
    EXPECT_DOUBLE_EQ(options.overlayOpacity, 0.5);
    EXPECT_FALSE(options.useGrayscale);
    EXPECT_TRUE(options.isValid());
    EXPECT_NO_THROW(options.validate());
}

TEST(DiffOptionsTest, CreateRejectsOutOfRangeValues)
{
    EXPECT_NO_THROW(DiffOptions::create(DiffMode::Threshold, 0.0, 0.0));
    EXPECT_NO_THROW(DiffOptions::create(DiffMode::Threshold, 255.0, 1.0));

    try {
        DiffOptions::create(DiffMode::Threshold, 256.0);
        FAIL() << "Expected DiffException";
    } catch (const DiffException& e) {
        EXPECT_EQ(e.type(), ErrorType::InvalidOptions);
    }

    EXPECT_THROW(DiffOptions::create(DiffMode::Overlay, 10.0, 1.5), DiffException);
    EXPECT_THROW(DiffOptions::create(DiffMode::Overlay, -1.0), DiffException);
    EXPECT_THROW(DiffOptions::create(DiffMode::Overlay, std::numeric_limits<double>::quiet_NaN()), DiffException);
}

TEST(DiffOptionsTest, ModeNames)
{
    bool ok = false;
    EXPECT_EQ(diffModeFromString("Heatmap", &ok), DiffMode::Heatmap);
    EXPECT_TRUE(ok);
    EXPECT_EQ(diffModeFromString("webgl", &ok), DiffMode::GPU);
    EXPECT_TRUE(ok);
    EXPECT_EQ(diffModeFromString("GPU", &ok), DiffMode::GPU);
    EXPECT_TRUE(ok);
    EXPECT_EQ(diffModeFromString("fuzzy", &ok), DiffMode::Pixel);
    EXPECT_FALSE(ok);

    EXPECT_EQ(diffModeToString(DiffMode::GPU), "webgl");
    EXPECT_EQ(diffModeToString(DiffMode::Semantic), "semantic");
}

TEST(DiffResultTest, PercentIsDerivedFromCounts)
{
    DiffResult quarter = DiffResult::fromCount(1, 4);
    EXPECT_EQ(quarter.differenceCount, 1);
    EXPECT_EQ(quarter.totalPixels, 4);
    EXPECT_DOUBLE_EQ(quarter.percentDiff, 25.0);

    EXPECT_DOUBLE_EQ(DiffResult::fromCount(0, 0).percentDiff, 0.0);
}

TEST(DiffResultTest, CountableRangeStopsAtIntMax)
{
    EXPECT_TRUE(DiffResult::isCountable(0, 0));
    EXPECT_TRUE(DiffResult::isCountable(46340, 46340));
    EXPECT_TRUE(DiffResult::isCountable(std::numeric_limits<int>::max(), 1));
    EXPECT_FALSE(DiffResult::isCountable(46341, 46341));
    EXPECT_FALSE(DiffResult::isCountable(70000, 70000));
    EXPECT_FALSE(DiffResult::isCountable(-1, 4));
}
