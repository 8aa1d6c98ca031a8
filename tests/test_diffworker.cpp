#include <gtest/gtest.h>
#include <QSignalSpy>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include "diffworker.h"
#include "errorhandler.h"
#include "testutils.h"

namespace {

constexpr auto RESPONSE_TIMEOUT = std::chrono::seconds(30);

PlatformCapabilities threadedCapabilities()
{
    PlatformCapabilities capabilities;
    capabilities.backgroundThreads = true;
    return capabilities;
}

WorkerRequest makeRequest(const Canvas& canvas1, const Canvas& canvas2, DiffMode mode = DiffMode::Pixel)
{
    WorkerRequest request;
    request.imageData1 = canvas1.getImageData();
    request.imageData2 = canvas2.getImageData();
    request.options.mode = mode;
    request.width = canvas1.width();
    request.height = canvas1.height();
    return request;
}

ErrorType failureType(std::future<WorkerResponse>& future)
{
    try {
        future.get();
    } catch (const DiffException& e) {
        return e.type();
    }
    ADD_FAILURE() << "Expected the request to fail";
    return ErrorType::Unknown;
}

// Holds the first comparison on the worker thread until the gate opens
class GatedDiffWorker : public DiffWorker
{
public:
    GatedDiffWorker()
        : DiffWorker(threadedCapabilities()),
          m_entered(m_enteredPromise.get_future()),
          m_gate(m_gatePromise.get_future().share())
    {
    }

    ~GatedDiffWorker() override
    {
        openGate();
        terminateWorker();
    }

    bool waitUntilComputing()
    {
        return m_entered.wait_for(RESPONSE_TIMEOUT) == std::future_status::ready;
    }

    void openGate()
    {
        std::call_once(m_openFlag, [this]() { m_gatePromise.set_value(); });
    }

protected:
    WorkerResponse computeResponse(const WorkerRequest& request) override
    {
        if (m_first.exchange(false)) {
            m_enteredPromise.set_value();
            m_gate.wait();
        }
        return DiffWorker::computeResponse(request);
    }

private:
    std::atomic<bool> m_first{true};
    std::promise<void> m_enteredPromise;
    std::future<void> m_entered;
    std::promise<void> m_gatePromise;
    std::shared_future<void> m_gate;
    std::once_flag m_openFlag;
};

} // namespace

TEST(DiffWorkerTest, ResponseMatchesSynchronousComputation)
{
    DiffWorker worker(threadedCapabilities());
    Canvas red = makeSolidCanvas(16, 8, 255, 0, 0);
    Canvas mixed = makeSolidCanvas(16, 8, 255, 0, 0);
    mixed.pixels()(cv::Rect(0, 0, 4, 8)).setTo(cv::Scalar(0, 0, 255, 255));

    WorkerResponse expected = DiffWorker::processRequest(makeRequest(red, mixed, DiffMode::Threshold));

    std::future<WorkerResponse> future = worker.postRequest(makeRequest(red, mixed, DiffMode::Threshold));
    ASSERT_EQ(future.wait_for(RESPONSE_TIMEOUT), std::future_status::ready);
    WorkerResponse response = future.get();

    EXPECT_EQ(response.differenceCount, 32);
    EXPECT_EQ(response.differenceCount, expected.differenceCount);
    EXPECT_EQ(response.totalPixels, expected.totalPixels);
    EXPECT_DOUBLE_EQ(response.percentDiff, expected.percentDiff);
    EXPECT_EQ(response.diffData, expected.diffData);
    EXPECT_EQ(response.originalData, expected.originalData);
    EXPECT_FALSE(worker.isProcessing());

    worker.terminateWorker();
}

TEST(DiffWorkerTest, CompareAsyncAndApplyToCanvas)
{
    DiffWorker worker(threadedCapabilities());
    Canvas white = makeSolidCanvas(2, 2, 255, 255, 255);
    Canvas black = makeSolidCanvas(2, 2, 0, 0, 0);

    std::future<WorkerResponse> future = worker.compareAsync(white, black, DiffOptions::create(DiffMode::Overlay, 10.0, 1.0));
    ASSERT_EQ(future.wait_for(RESPONSE_TIMEOUT), std::future_status::ready);
    WorkerResponse response = future.get();

    DiffResult result = response.toDiffResult();
    EXPECT_EQ(result.differenceCount, 4);
    EXPECT_EQ(result.totalPixels, 4);
    EXPECT_DOUBLE_EQ(result.percentDiff, 100.0);

    Canvas output;
    DiffWorker::applyToCanvas(response, 2, 2, output);
    EXPECT_EQ(pixelAt(output, 1, 1), cv::Vec4b(255, 0, 0, 255));
}

TEST(DiffWorkerTest, CompareAsyncRejectsMismatchedSurfaces)
{
    DiffWorker worker(threadedCapabilities());
    Canvas small = makeSolidCanvas(2, 2, 0, 0, 0);
    Canvas large = makeSolidCanvas(3, 3, 0, 0, 0);

    EXPECT_THROW(worker.compareAsync(small, large, DiffOptions()), DiffException);
    EXPECT_FALSE(worker.isProcessing());
}

TEST(DiffWorkerTest, InitializationFailsWithoutThreadSupport)
{
    PlatformCapabilities capabilities;
    capabilities.backgroundThreads = false;
    DiffWorker worker(capabilities);
    Canvas page = makeSolidCanvas(2, 2, 0, 0, 0);

    std::future<WorkerResponse> future = worker.postRequest(makeRequest(page, page));

    EXPECT_EQ(failureType(future), ErrorType::WorkerInitFailed);
    EXPECT_FALSE(worker.isProcessing());
    EXPECT_FALSE(worker.isRunning());
}

TEST(DiffWorkerTest, InvalidOptionsAreRejected)
{
    DiffWorker worker(threadedCapabilities());
    Canvas page = makeSolidCanvas(2, 2, 0, 0, 0);
    WorkerRequest request = makeRequest(page, page);
    request.options.overlayOpacity = 2.0;

    std::future<WorkerResponse> future = worker.postRequest(std::move(request));

    EXPECT_EQ(failureType(future), ErrorType::InvalidOptions);
}

TEST(DiffWorkerTest, FaultInsideWorkerIsReportedAsCrash)
{
    DiffWorker worker(threadedCapabilities());
    WorkerRequest request;
    request.imageData1 = PixelBuffer(10, 0);
    request.imageData2 = PixelBuffer(10, 0);
    request.width = 4;
    request.height = 4;

    std::future<WorkerResponse> future = worker.postRequest(std::move(request));
    ASSERT_EQ(future.wait_for(RESPONSE_TIMEOUT), std::future_status::ready);

    EXPECT_EQ(failureType(future), ErrorType::WorkerCrash);
    EXPECT_FALSE(worker.isProcessing());

    // The worker keeps serving requests after a fault
    Canvas page = makeSolidCanvas(2, 2, 0, 0, 0);
    std::future<WorkerResponse> next = worker.postRequest(makeRequest(page, page));
    ASSERT_EQ(next.wait_for(RESPONSE_TIMEOUT), std::future_status::ready);
    EXPECT_EQ(next.get().differenceCount, 0);
}

TEST(DiffWorkerTest, TerminateIsIdempotent)
{
    DiffWorker worker(threadedCapabilities());

    worker.terminateWorker();
    worker.terminateWorker();
    EXPECT_FALSE(worker.isProcessing());

    Canvas page = makeSolidCanvas(2, 2, 0, 0, 0);
    std::future<WorkerResponse> future = worker.postRequest(makeRequest(page, page));
    ASSERT_EQ(future.wait_for(RESPONSE_TIMEOUT), std::future_status::ready);
    future.get();

    worker.terminateWorker();
    worker.terminateWorker();
    EXPECT_FALSE(worker.isProcessing());
    EXPECT_FALSE(worker.isRunning());
}

TEST(DiffWorkerTest, TerminateDiscardsResultOfRunningComparison)
{
    GatedDiffWorker worker;
    QSignalSpy completed(&worker, &DiffWorker::requestCompleted);
    Canvas white = makeSolidCanvas(4, 4, 255, 255, 255);
    Canvas black = makeSolidCanvas(4, 4, 0, 0, 0);

    std::future<WorkerResponse> future = worker.postRequest(makeRequest(white, black));
    ASSERT_TRUE(worker.waitUntilComputing());

    // terminateWorker() blocks until the held comparison finishes
    std::thread terminator([&worker]() { worker.terminateWorker(); });
    const bool rejected = future.wait_for(RESPONSE_TIMEOUT) == std::future_status::ready;
    worker.openGate();
    terminator.join();

    ASSERT_TRUE(rejected);
    EXPECT_EQ(failureType(future), ErrorType::WorkerTerminated);
    EXPECT_EQ(completed.count(), 0);
    EXPECT_FALSE(worker.isProcessing());
    EXPECT_FALSE(worker.isRunning());
}

TEST(DiffWorkerTest, NewRequestSupersedesPrevious)
{
    GatedDiffWorker worker;
    QSignalSpy completed(&worker, &DiffWorker::requestCompleted);
    Canvas white = makeSolidCanvas(4, 4, 255, 255, 255);
    Canvas black = makeSolidCanvas(4, 4, 0, 0, 0);
    Canvas small = makeSolidCanvas(2, 2, 0, 0, 0);

    std::future<WorkerResponse> first = worker.postRequest(makeRequest(white, black));
    ASSERT_TRUE(worker.waitUntilComputing());

    std::future<WorkerResponse> second = worker.postRequest(makeRequest(small, small));
    ASSERT_EQ(first.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(failureType(first), ErrorType::WorkerSuperseded);

    worker.openGate();
    ASSERT_EQ(second.wait_for(RESPONSE_TIMEOUT), std::future_status::ready);
    WorkerResponse response = second.get();
    EXPECT_EQ(response.totalPixels, 4);
    EXPECT_EQ(response.differenceCount, 0);

    // Join so every emission has happened; the first result (16 differences) is dropped
    worker.terminateWorker();
    ASSERT_EQ(completed.count(), 1);
    EXPECT_EQ(completed.at(0).at(0).toInt(), 0);
    EXPECT_DOUBLE_EQ(completed.at(0).at(1).toDouble(), 0.0);
    EXPECT_FALSE(worker.isProcessing());
}

TEST(DiffWorkerTest, RequestPostedDuringTerminationIsServed)
{
    GatedDiffWorker worker;
    Canvas white = makeSolidCanvas(4, 4, 255, 255, 255);
    Canvas black = makeSolidCanvas(4, 4, 0, 0, 0);
    Canvas small = makeSolidCanvas(2, 2, 0, 0, 0);

    std::future<WorkerResponse> first = worker.postRequest(makeRequest(white, black));
    ASSERT_TRUE(worker.waitUntilComputing());

    std::thread terminator([&worker]() { worker.terminateWorker(); });
    // The first request is rejected before terminateWorker() starts joining
    const bool rejected = first.wait_for(RESPONSE_TIMEOUT) == std::future_status::ready;

    std::future<WorkerResponse> second;
    std::thread poster([&worker, &small, &second]() {
        second = worker.postRequest(makeRequest(small, small));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    worker.openGate();
    terminator.join();
    poster.join();

    ASSERT_TRUE(rejected);
    EXPECT_EQ(failureType(first), ErrorType::WorkerTerminated);
    ASSERT_EQ(second.wait_for(RESPONSE_TIMEOUT), std::future_status::ready);
    WorkerResponse response = second.get();
    EXPECT_EQ(response.totalPixels, 4);
    EXPECT_EQ(response.differenceCount, 0);
    EXPECT_FALSE(worker.isProcessing());
}

TEST(DiffWorkerTest, ProcessRequestValidatesLengths)
{
    WorkerRequest request;
    request.imageData1 = PixelBuffer(16, 0);
    request.imageData2 = PixelBuffer(12, 0);
    request.width = 2;
    request.height = 2;

    EXPECT_THROW(DiffWorker::processRequest(request), std::invalid_argument);
}

TEST(DiffWorkerTest, ProcessRequestRejectsUncountableSize)
{
    WorkerRequest request;
    request.width = 70000;
    request.height = 70000;

    try {
        DiffWorker::processRequest(request);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("countable"), std::string::npos);
    }
}

TEST(DiffWorkerTest, EmptyRequestYieldsZero)
{
    WorkerResponse response = DiffWorker::processRequest(WorkerRequest());

    EXPECT_EQ(response.differenceCount, 0);
    EXPECT_EQ(response.totalPixels, 0);
    EXPECT_DOUBLE_EQ(response.percentDiff, 0.0);
}
