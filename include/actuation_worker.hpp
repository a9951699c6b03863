/**
 * @file actuation_worker.hpp
 * @brief Actuation Worker
 *
 * Dedicated thread in front of SeatHeaterActuator.
 *   - At most one apply() in flight
 *   - submit() replaces any decision still waiting; stale decisions are dropped
 *   - Override resets run before the next pending decision
 *   - stop() joins the thread and writes nothing
 *   - A batch with a failed or unavailable zone flags the decision for retry
 */

#ifndef ACTUATION_WORKER_HPP
#define ACTUATION_WORKER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "seat_actuator.hpp"

using ActuationResultCallback = std::function<void(const HeatingDecision&,
                                                   const std::vector<ZoneActuationResult>&)>;

class ActuationWorker {
public:
    explicit ActuationWorker(SeatHeaterActuator& actuator);
    ~ActuationWorker();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    /**
     * @brief Queue a decision, replacing any pending one
     */
    void submit(const HeatingDecision& decision);

    /**
     * @brief Queue an override reset ahead of the next decision
     */
    void requestOverrideReset();

    /**
     * @brief Block until nothing is pending or in flight
     * @return false on timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    void setResultCallback(ActuationResultCallback callback);

    uint64_t getAppliedCount() const { return applied_count_; }

    /**
     * @brief Last applied batch left a zone FAILED or UNAVAILABLE
     */
    bool needsRetry() const { return retry_needed_; }

private:
    SeatHeaterActuator& actuator_;

    std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable idle_cv_;
    std::optional<HeatingDecision> pending_;
    bool reset_pending_;
    bool busy_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> applied_count_;
    std::atomic<bool> retry_needed_;
    ActuationResultCallback result_callback_;
    std::thread thread_;

    void run();
};

#endif // ACTUATION_WORKER_HPP
