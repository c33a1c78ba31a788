#include <intersect/weight_updater.hpp>
#include <intersect/log.hpp>
#include <intersect/variability.hpp>

namespace intersect {

WeightUpdateQueue::WeightUpdateQueue(ProfileStore& profiles, TraitAnalyzer& analyzer,
                                     TraitConfig traits, VariabilityConfig variability)
    : profiles_(profiles)
    , analyzer_(analyzer)
    , combiner_(traits)
    , variability_(variability) {}

WeightUpdateQueue::~WeightUpdateQueue() {
    stop();
}

void WeightUpdateQueue::start() {
    if (running_.exchange(true)) return;  // Already running
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    thread_ = std::thread([this]() { run(); });
    log(LogCategory::Memory, "", "Weight update worker started");
}

void WeightUpdateQueue::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    idle_cv_.notify_all();
    log(LogCategory::Memory, "", "Weight update worker stopped (%zu processed, %zu failed)",
        processed_.load(), failed_.load());
}

void WeightUpdateQueue::submit(TraitJob job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    work_cv_.notify_one();
}

void WeightUpdateQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return !running_ || (jobs_.empty() && !busy_);
    });
}

void WeightUpdateQueue::on_shift(ShiftCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_shift_ = std::move(callback);
}

size_t WeightUpdateQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void WeightUpdateQueue::run() {
    while (true) {
        TraitJob job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) break;  // stopping and drained
            job = std::move(jobs_.front());
            jobs_.pop_front();
            busy_ = true;
        }

        process(job);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void WeightUpdateQueue::process(const TraitJob& job) {
    try {
        auto intrinsic = analyzer_.intrinsic(job.user_message, job.conversation_id);
        auto engagement = analyzer_.engagement(job.user_message, job.previous_responses,
                                               job.conversation_id);
        PersonaVector delta = combiner_.delta(intrinsic, engagement, job.challenge_mode);

        AffinityWeights before;
        float scale = 0.0f;
        AffinityWeights after = profiles_.update_weights(
            job.user_id, [&](const AffinityWeights& current, uint64_t total_messages) {
                before = current;
                scale = variability(total_messages, variability_);
                return current.apply_delta(delta, scale);
            });

        log(LogCategory::Memory, job.conversation_id,
            "Weights I=%.3f L=%.3f P=%.3f -> I=%.3f L=%.3f P=%.3f (variability %.3f)",
            before.instinct(), before.logic(), before.psyche(),
            after.instinct(), after.logic(), after.psyche(), scale);

        WeightShift shift;
        if (describe_shift(before, after, shift)) {
            ShiftCallback callback;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                callback = on_shift_;
            }
            log(LogCategory::Memory, job.conversation_id, "Weight %s: %s -> %s (%.3f)",
                shift_kind_name(shift.kind), persona_name(shift.old_dominant),
                persona_name(shift.new_dominant), shift.total_shift);
            if (callback) callback(job.user_id, shift);
        }
        processed_++;
    } catch (const std::exception& e) {
        failed_++;
        log(LogCategory::Error, job.conversation_id, "Weight update failed: %s", e.what());
    }
}

} // namespace intersect
