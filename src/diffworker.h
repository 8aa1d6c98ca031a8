#ifndef DIFFWORKER_H
#define DIFFWORKER_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <future>
#include <memory>
#include "canvas.h"
#include "diffoptions.h"
#include "platformdetector.h"

/**
 * Message sent to the worker. The pixel buffers are moved in; the caller's
 * copies are left empty.
 */
struct WorkerRequest {
    PixelBuffer imageData1;
    PixelBuffer imageData2;
    DiffOptions options;
    int width = 0;
    int height = 0;
};

/**
 * Message returned by the worker
 */
struct WorkerResponse {
    PixelBuffer diffData;
    PixelBuffer originalData;
    int differenceCount = 0;
    int totalPixels = 0;
    double percentDiff = 0.0;

    DiffResult toDiffResult() const;
};

/**
 * Runs the comparison algorithms on a dedicated thread
 *
 * One request is outstanding at a time. Posting a new request rejects the
 * previous one with WorkerSuperseded. terminateWorker() rejects the outstanding
 * request with WorkerTerminated, then blocks until a running comparison has
 * finished and the thread has exited; that late result is discarded. The thread
 * starts lazily on the first request and again after a termination. A request
 * posted while a termination is in progress waits for it and goes to the
 * restarted thread.
 */
class DiffWorker : public QThread
{
    Q_OBJECT

public:
    explicit DiffWorker(QObject *parent = nullptr);
    DiffWorker(const PlatformCapabilities& capabilities, QObject *parent = nullptr);
    ~DiffWorker() override;

    /**
     * Send a request to the worker
     * @param request Buffers and options, moved into the worker
     * @return Future resolved with the response, or holding a DiffException
     *         (WorkerInitFailed, WorkerCrash, WorkerTerminated, WorkerSuperseded)
     */
    std::future<WorkerResponse> postRequest(WorkerRequest&& request);

    /**
     * Copy both surfaces' pixels and post them
     * @throws DiffException (CanvasError) if a surface cannot be read
     *         or the sizes differ
     */
    std::future<WorkerResponse> compareAsync(const Canvas& canvas1, const Canvas& canvas2,
                                             const DiffOptions& options);

    /**
     * Write a response's diff pixels into a surface, resizing it first
     */
    static void applyToCanvas(const WorkerResponse& response, int width, int height, Canvas& canvas);

    /**
     * Compute a response synchronously on the calling thread
     * @throws std::invalid_argument when buffer lengths do not match width*height*4
     */
    static WorkerResponse processRequest(const WorkerRequest& request);

    /**
     * Check if a request is outstanding
     * @return true while a posted request has not completed or failed
     */
    bool isProcessing() const;

    /**
     * Stop the worker thread. Safe to call repeatedly or before first use.
     * Blocks until an in-flight comparison completes, so it must not be
     * called from a slot directly connected to this worker's signals.
     */
    void terminateWorker();

signals:
    void requestCompleted(int differenceCount, double percentDiff);
    void requestFailed(const QString& error);

protected:
    void run() override;

    /**
     * Compute one request on the worker thread, processRequest() by default
     */
    virtual WorkerResponse computeResponse(const WorkerRequest& request);

private:
    struct PendingJob {
        WorkerRequest request;
        quint64 generation = 0;
    };

    bool initWorker();

    PlatformCapabilities m_capabilities;

    // Serializes thread start against terminate-and-join
    QMutex m_lifecycleMutex;
    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    bool m_shouldStop;
    bool m_isProcessing;
    quint64 m_generation;

    std::unique_ptr<PendingJob> m_pendingJob;
    std::unique_ptr<std::promise<WorkerResponse>> m_activePromise;
};

#endif // DIFFWORKER_H
