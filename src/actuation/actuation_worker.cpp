/**
 * @file actuation_worker.cpp
 * @brief Actuation Worker Implementation
 */

#include "actuation_worker.hpp"
#include <iostream>

ActuationWorker::ActuationWorker(SeatHeaterActuator& actuator)
    : actuator_(actuator),
      reset_pending_(false),
      busy_(false),
      running_(false),
      applied_count_(0),
      retry_needed_(false) {
}

ActuationWorker::~ActuationWorker() {
    stop();
}

void ActuationWorker::start() {
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&ActuationWorker::run, this);
    std::cout << "[WORKER] ✓ Actuation worker started\n";
}

void ActuationWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_) {
            std::cout << "[WORKER] Dropping pending decision on shutdown\n";
            pending_.reset();
        }
        reset_pending_ = false;
    }
    idle_cv_.notify_all();
    std::cout << "[WORKER] ✓ Actuation worker stopped\n";
}

void ActuationWorker::submit(const HeatingDecision& decision) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = decision;
    }
    wake_cv_.notify_one();
}

void ActuationWorker::requestOverrideReset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_pending_ = true;
    }
    wake_cv_.notify_one();
}

bool ActuationWorker::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return !busy_ && !pending_ && !reset_pending_;
    });
}

void ActuationWorker::setResultCallback(ActuationResultCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_callback_ = callback;
}

void ActuationWorker::run() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_cv_.wait(lock, [this] {
            return !running_ || pending_ || reset_pending_;
        });

        if (!running_) {
            break;
        }

        bool do_reset = reset_pending_;
        reset_pending_ = false;
        std::optional<HeatingDecision> decision;
        decision.swap(pending_);
        ActuationResultCallback callback = result_callback_;
        busy_ = true;
        lock.unlock();

        if (do_reset) {
            actuator_.resetOverrides();
        }

        if (decision) {
            std::vector<ZoneActuationResult> results = actuator_.apply(*decision);
            applied_count_++;

            bool incomplete = false;
            for (const auto& result : results) {
                if (result.status == ActuationStatus::FAILED ||
                    result.status == ActuationStatus::UNAVAILABLE) {
                    incomplete = true;
                }
            }
            retry_needed_ = incomplete;
            if (callback) {
                callback(*decision, results);
            }
        }

        lock.lock();
        busy_ = false;
        lock.unlock();
        idle_cv_.notify_all();
    }
}
