#include "dat_toolkit/BatchOrchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace dat_toolkit {

// ──────────────────────────── EventChannel ─────────────────────────────────
void EventChannel::push(BatchEvent ev)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(ev));
    }
    ready_.notify_one();
}

std::optional<BatchEvent> EventChannel::tryPop()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) return std::nullopt;
    BatchEvent ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

BatchEvent EventChannel::waitPop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return !events_.empty(); });
    BatchEvent ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

// ───────────────────────────── tracking ────────────────────────────────────
namespace {

// Counts completions of one batch. Progress, Result and (for the last
// completion) Done are published under one lock so Done is always last.
class BatchTracker {
public:
    BatchTracker(std::shared_ptr<EventChannel> channel, std::size_t total)
        : channel_(std::move(channel)), total_(total) {}

    void complete(std::size_t index, ConversionOutcome outcome)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool last = ++completed_ == total_;
        try {
            BatchEvent progress;
            progress.type      = BatchEvent::Type::Progress;
            progress.completed = completed_;
            progress.total     = total_;
            channel_->push(std::move(progress));

            BatchEvent result;
            result.type      = BatchEvent::Type::Result;
            result.completed = completed_;
            result.total     = total_;
            result.pairIndex = index;
            result.outcome   = std::move(outcome);
            channel_->push(std::move(result));
        } catch (const std::exception&) {
            // the consumer still has to see Done
            if (last) pushDone(*channel_, total_);
            throw;
        }
        if (last) pushDone(*channel_, total_);
    }

    static void pushDone(EventChannel& channel, std::size_t total)
    {
        BatchEvent done;
        done.type      = BatchEvent::Type::Done;
        done.completed = total;
        done.total     = total;
        channel.push(std::move(done));
    }

private:
    std::shared_ptr<EventChannel> channel_;
    std::size_t                   total_;
    std::size_t                   completed_ = 0;
    std::mutex                    mutex_;
};

ConversionOutcome failedOutcome(const FilePair& pair, const std::string& reason)
{
    ConversionOutcome res;
    res.source      = pair.source;
    res.destination = pair.destination;
    res.error       = ErrorKind::MalformedInput;
    res.message     = "Error converting " + pair.source.filename().string() + ": " + reason;
    return res;
}

} // namespace

// ────────────────────────── BatchOrchestrator ──────────────────────────────
int BatchOrchestrator::clampConcurrency(int requested)
{
    return std::max(kMinConcurrency, std::min(kMaxConcurrency, requested));
}

BatchOrchestrator::BatchOrchestrator(int concurrency)
    : concurrency_(clampConcurrency(concurrency)),
      pool_(static_cast<std::size_t>(concurrency_))
{
}

BatchOrchestrator::~BatchOrchestrator()
{
    shutdown();
}

std::shared_ptr<EventChannel> BatchOrchestrator::run(const std::vector<FilePair>& pairs,
                                                     const ConversionParameters& params,
                                                     bool backupEnabled)
{
    auto channel = std::make_shared<EventChannel>();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
        throw std::runtime_error("batch orchestrator is shut down");

    if (pairs.empty()) {
        BatchTracker::pushDone(*channel, 0);
        return channel;
    }

    auto tracker = std::make_shared<BatchTracker>(channel, pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        FilePair pair = pairs[i];
        pending_.push_back(pool_.Enqueue([tracker, pair, params, backupEnabled, i] {
            ConversionOutcome res;
            try {
                res = convertFile(pair.source, pair.destination, params, backupEnabled);
            } catch (const std::exception& e) {
                res = failedOutcome(pair, e.what());
            }
            tracker->complete(i, std::move(res));
        }));
    }
    return channel;
}

std::vector<std::future<void>> BatchOrchestrator::takePending()
{
    std::vector<std::future<void>> pending;
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(pending_);
    return pending;
}

void BatchOrchestrator::wait()
{
    for (auto& f : takePending()) f.get();
}

void BatchOrchestrator::shutdown() noexcept
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    // only block here; a task failure is for wait() to report
    for (auto& f : takePending()) f.wait();
    pool_.stop();
}

// ───────────────────────────── runBatch() ──────────────────────────────────
BatchSummary runBatch(const std::vector<FilePair>& pairs,
                      const ConversionParameters& params,
                      bool backupEnabled,
                      int concurrency,
                      const std::function<void(const BatchEvent&)>& onEvent)
{
    BatchOrchestrator orchestrator(concurrency);
    auto channel = orchestrator.run(pairs, params, backupEnabled);

    BatchSummary summary;
    summary.total = pairs.size();
    while (true) {
        BatchEvent ev = channel->waitPop();
        if (ev.type == BatchEvent::Type::Result)
            ++(ev.outcome.success ? summary.succeeded : summary.failed);
        if (onEvent) onEvent(ev);
        if (ev.type == BatchEvent::Type::Done) break;
    }
    return summary;
}

} // namespace dat_toolkit
