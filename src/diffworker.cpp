#include "diffworker.h"
#include "diffalgorithms.h"
#include "errorhandler.h"
#include "performancemonitor.h"
#include <stdexcept>

DiffResult WorkerResponse::toDiffResult() const
{
    DiffResult result;
    result.differenceCount = differenceCount;
    result.totalPixels = totalPixels;
    result.percentDiff = percentDiff;
    return result;
}

DiffWorker::DiffWorker(QObject *parent)
    : DiffWorker(PlatformDetector::getInstance().getCapabilities(), parent)
{
}

DiffWorker::DiffWorker(const PlatformCapabilities& capabilities, QObject *parent)
    : QThread(parent),
      m_capabilities(capabilities),
      m_shouldStop(false),
      m_isProcessing(false),
      m_generation(0)
{
}

DiffWorker::~DiffWorker()
{
    terminateWorker();
}

bool DiffWorker::initWorker()
{
    if (!m_capabilities.backgroundThreads) {
        return false;
    }

    if (!isRunning()) {
        m_shouldStop = false;
        start();
    }
    return isRunning();
}

std::future<WorkerResponse> DiffWorker::postRequest(WorkerRequest&& request)
{
    auto promise = std::make_unique<std::promise<WorkerResponse>>();
    std::future<WorkerResponse> future = promise->get_future();

    if (!request.options.isValid()) {
        promise->set_exception(std::make_exception_ptr(
            DiffException(ErrorType::InvalidOptions, "Diff options out of range")));
        return future;
    }

    QMutexLocker lifecycleLocker(&m_lifecycleMutex);
    QMutexLocker locker(&m_mutex);

    if (!initWorker()) {
        LOG_ERROR("Worker", "Worker initialization failed");
        promise->set_exception(std::make_exception_ptr(
            DiffException(ErrorType::WorkerInitFailed, "Worker initialization failed")));
        return future;
    }

    if (m_activePromise) {
        LOG_DEBUG("Worker", "Previous request superseded");
        m_activePromise->set_exception(std::make_exception_ptr(
            DiffException(ErrorType::WorkerSuperseded, "Request superseded by a newer comparison")));
        m_activePromise.reset();
    }

    m_generation++;
    m_pendingJob = std::make_unique<PendingJob>();
    m_pendingJob->request = std::move(request);
    m_pendingJob->generation = m_generation;
    m_activePromise = std::move(promise);
    m_isProcessing = true;

    m_condition.wakeOne();
    return future;
}

std::future<WorkerResponse> DiffWorker::compareAsync(const Canvas& canvas1, const Canvas& canvas2,
                                                     const DiffOptions& options)
{
    if (canvas1.width() != canvas2.width() || canvas1.height() != canvas2.height()) {
        throw DiffException(ErrorType::CanvasError, "Surfaces must have the same size before offloading");
    }

    WorkerRequest request;
    request.imageData1 = canvas1.getImageData();
    request.imageData2 = canvas2.getImageData();
    request.options = options;
    request.width = canvas1.width();
    request.height = canvas1.height();

    return postRequest(std::move(request));
}

void DiffWorker::applyToCanvas(const WorkerResponse& response, int width, int height, Canvas& canvas)
{
    canvas.resize(width, height);
    canvas.putImageData(response.diffData);
}

WorkerResponse DiffWorker::processRequest(const WorkerRequest& request)
{
    if (request.width < 0 || request.height < 0) {
        throw std::invalid_argument("Negative image dimensions");
    }
    if (!DiffResult::isCountable(request.width, request.height)) {
        throw std::invalid_argument("Image size " + std::to_string(request.width) + "x" +
                                    std::to_string(request.height) + " exceeds the countable pixel range");
    }

    const size_t expected = static_cast<size_t>(request.width) * request.height * 4;
    if (request.imageData1.size() != expected || request.imageData2.size() != expected) {
        throw std::invalid_argument("Image data length does not match " + std::to_string(request.width) +
                                    "x" + std::to_string(request.height));
    }
    request.options.validate();

    WorkerResponse response;
    response.totalPixels = request.width * request.height;
    if (expected == 0) {
        return response;
    }

    response.diffData.resize(expected);
    response.originalData.resize(expected);

    const cv::Mat image1(request.height, request.width, CV_8UC4, const_cast<uint8_t*>(request.imageData1.data()));
    const cv::Mat image2(request.height, request.width, CV_8UC4, const_cast<uint8_t*>(request.imageData2.data()));
    cv::Mat diff(request.height, request.width, CV_8UC4, response.diffData.data());
    cv::Mat original(request.height, request.width, CV_8UC4, response.originalData.data());

    response.differenceCount = DiffAlgorithms::compare(image1, image2, diff, request.options, &original);

    DiffResult stats = DiffResult::fromCount(response.differenceCount, response.totalPixels);
    response.percentDiff = stats.percentDiff;
    return response;
}

WorkerResponse DiffWorker::computeResponse(const WorkerRequest& request)
{
    return processRequest(request);
}

bool DiffWorker::isProcessing() const
{
    QMutexLocker locker(&m_mutex);
    return m_isProcessing;
}

void DiffWorker::terminateWorker()
{
    QMutexLocker lifecycleLocker(&m_lifecycleMutex);
    {
        QMutexLocker locker(&m_mutex);
        m_shouldStop = true;
        m_generation++;
        m_pendingJob.reset();

        if (m_activePromise) {
            m_activePromise->set_exception(std::make_exception_ptr(
                DiffException(ErrorType::WorkerTerminated, "Worker terminated")));
            m_activePromise.reset();
        }
        m_isProcessing = false;
        m_condition.wakeOne();
    }

    wait();
}

void DiffWorker::run()
{
    LOG_DEBUG("Worker", "Diff worker started");

    while (true) {
        std::unique_ptr<PendingJob> job;
        {
            QMutexLocker locker(&m_mutex);
            while (!m_shouldStop && !m_pendingJob) {
                m_condition.wait(&m_mutex);
            }
            if (m_shouldStop) {
                break;
            }
            job = std::move(m_pendingJob);
        }

        WorkerResponse response;
        QString failure;
        try {
            PERF_TIMER_CAT("workerCompare", "Worker");
            response = computeResponse(job->request);
        } catch (const std::exception& e) {
            failure = QString::fromStdString(e.what());
        } catch (...) {
            failure = "Unknown exception in diff worker";
        }

        const int differenceCount = response.differenceCount;
        const double percentDiff = response.percentDiff;
        bool delivered = false;
        {
            QMutexLocker locker(&m_mutex);
            if (job->generation == m_generation && m_activePromise) {
                if (failure.isEmpty()) {
                    m_activePromise->set_value(std::move(response));
                } else {
                    m_activePromise->set_exception(std::make_exception_ptr(
                        DiffException(ErrorType::WorkerCrash, failure.toStdString())));
                }
                m_activePromise.reset();
                m_isProcessing = false;
                delivered = true;
            }
        }

        if (!delivered) {
            LOG_DEBUG("Worker", "Discarded result of an abandoned request");
            continue;
        }

        if (failure.isEmpty()) {
            emit requestCompleted(differenceCount, percentDiff);
        } else {
            LOG_ERROR("Worker", "Diff worker error: " + failure.toStdString());
            emit requestFailed(failure);
        }
    }

    LOG_DEBUG("Worker", "Diff worker stopped");
}
