#ifndef DOCSCAN_DETECTION_WORKER_HPP
#define DOCSCAN_DETECTION_WORKER_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "document_detector.hpp"
#include "frame.hpp"

// Background detection for one frame source.
//
// Holds at most one pending frame. submit() returns false and drops the frame
// while a detection is queued or in flight, so the caller never blocks and
// results never lag behind the camera. The callback runs on the worker thread.
class DetectionWorker {
public:
    typedef std::function<void(const DetectionResult&)> ResultCallback;

    DetectionWorker(const DetectorConfig& config, ResultCallback callback);
    ~DetectionWorker();

    DetectionWorker(const DetectionWorker&) = delete;
    DetectionWorker& operator=(const DetectionWorker&) = delete;

    // Copies the frame (the caller's buffer may be reused right after).
    // Returns false when the frame was dropped.
    bool submit(const Frame& frame, const RegionOfInterest* roi = nullptr);

    bool busy() const { return busy_.load(); }

    int processedCount() const { return processed_.load(); }
    int droppedCount() const { return dropped_.load(); }

    // Stops accepting frames and joins the thread; called by the destructor
    void stop();

private:
    void run();

    DocumentDetector detector_;
    ResultCallback callback_;

    std::mutex mutex_;
    std::condition_variable cond_;
    bool has_pending_;
    bool stopping_;
    Frame pending_;
    bool pending_has_roi_;
    RegionOfInterest pending_roi_;

    std::atomic<bool> busy_;
    std::atomic<int> processed_;
    std::atomic<int> dropped_;

    std::thread thread_;
};

#endif // DOCSCAN_DETECTION_WORKER_HPP
