#include "detection_worker.hpp"

#include "log.hpp"

namespace {
const char* TAG = "DetectionWorker";
}

DetectionWorker::DetectionWorker(const DetectorConfig& config, ResultCallback callback)
    : detector_(config),
      callback_(callback),
      has_pending_(false),
      stopping_(false),
      pending_has_roi_(false),
      busy_(false),
      processed_(0),
      dropped_(0) {
    thread_ = std::thread(&DetectionWorker::run, this);
}

DetectionWorker::~DetectionWorker() {
    stop();
}

void DetectionWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cond_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool DetectionWorker::submit(const Frame& frame, const RegionOfInterest* roi) {
    if (frame.empty()) {
        return false;
    }

    // Latest frame wins: a frame arriving while busy is dropped, not queued
    if (busy_.exchange(true)) {
        dropped_++;
        DOCSCAN_LOGD(TAG, "Busy, dropping %dx%d frame", frame.width(), frame.height());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            busy_ = false;
            return false;
        }
        pending_ = frame.clone();
        pending_has_roi_ = roi != nullptr;
        if (roi) {
            pending_roi_ = *roi;
        }
        has_pending_ = true;
    }
    cond_.notify_one();
    return true;
}

void DetectionWorker::run() {
    for (;;) {
        Frame frame;
        bool hasRoi = false;
        RegionOfInterest roi;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return has_pending_ || stopping_; });
            if (stopping_) {
                return;
            }
            frame = pending_;
            hasRoi = pending_has_roi_;
            roi = pending_roi_;
            pending_ = Frame();
            has_pending_ = false;
        }

        DetectionResult result;
        try {
            result = detector_.detect(frame, hasRoi ? &roi : nullptr);
        } catch (const cv::Exception& e) {
            DOCSCAN_LOGE(TAG, "Detection failed: %s", e.what());
        }

        processed_++;
        if (callback_) {
            callback_(result);
        }
        busy_ = false;
    }
}
