#pragma once
// Weight Update Queue: trait analysis off the response path
//
// handle_turn enqueues one TraitJob after its responses are final and
// returns without waiting. A single worker thread consumes jobs in order:
// judge intrinsic + engagement signals, combine, apply through
// apply_delta inside the store's atomic read-modify-write.
//
// Eventually consistent: a turn that starts before the previous turn's
// job has been applied routes on the older persistent weights.
// Job failures are logged and dropped; they never reach a caller.

#include "affinity.hpp"
#include "config.hpp"
#include "store.hpp"
#include "trait_analysis.hpp"
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace intersect {

struct TraitJob {
    std::string user_id;
    std::string conversation_id;
    std::string user_message;
    std::vector<Utterance> previous_responses;  // persona responses the message replies to
    bool challenge_mode = false;
};

using ShiftCallback = std::function<void(const std::string& user_id, const WeightShift& shift)>;

class WeightUpdateQueue {
public:
    WeightUpdateQueue(ProfileStore& profiles, TraitAnalyzer& analyzer,
                      TraitConfig traits = {}, VariabilityConfig variability = {});
    ~WeightUpdateQueue();

    WeightUpdateQueue(const WeightUpdateQueue&) = delete;
    WeightUpdateQueue& operator=(const WeightUpdateQueue&) = delete;

    void start();

    // Finish every job already submitted, then join the worker
    void stop();

    bool is_running() const { return running_; }

    // Never blocks on analysis
    void submit(TraitJob job);

    // Block until the queue is empty and no job is in flight.
    // Returns immediately when the worker is not running.
    void wait_idle();

    void on_shift(ShiftCallback callback);

    size_t pending() const;
    size_t processed() const { return processed_; }
    size_t failed() const { return failed_; }

    // Process one job on the calling thread (CLI one-shot use)
    void process(const TraitJob& job);

private:
    void run();

    ProfileStore& profiles_;
    TraitAnalyzer& analyzer_;
    TraitAnalysisCombiner combiner_;
    VariabilityConfig variability_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<TraitJob> jobs_;
    bool busy_ = false;
    bool stopping_ = false;
    ShiftCallback on_shift_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> processed_{0};
    std::atomic<size_t> failed_{0};
    std::thread thread_;
};

} // namespace intersect
