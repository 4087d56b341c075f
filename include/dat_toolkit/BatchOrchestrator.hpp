#pragma once
#include "ConversionWorker.hpp"
#include "NodesFormat.hpp"
#include "ThreadPool.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace dat_toolkit {

struct FilePair {
    std::filesystem::path source;
    std::filesystem::path destination;
};

struct BatchEvent {
    enum class Type { Progress, Result, Done };

    Type        type      = Type::Progress;
    std::size_t completed = 0;     // Progress
    std::size_t total     = 0;     // Progress, Done
    std::size_t pairIndex = 0;     // Result: index into the submitted pairs
    ConversionOutcome outcome;     // Result
};

// Many producers (pool workers), one consumer. The consumer drains at its
// own pace with tryPop() from a UI tick, or blocks in waitPop().
class EventChannel {
public:
    void push(BatchEvent ev);
    std::optional<BatchEvent> tryPop();
    BatchEvent waitPop();

private:
    std::mutex              mutex_;
    std::condition_variable ready_;
    std::deque<BatchEvent>  events_;
};

struct BatchSummary {
    std::size_t total     = 0;
    std::size_t succeeded = 0;
    std::size_t failed    = 0;
};

class BatchOrchestrator {
public:
    static constexpr int kMinConcurrency = 1;
    static constexpr int kMaxConcurrency = 16;

    static int clampConcurrency(int requested);

    explicit BatchOrchestrator(int concurrency);
    ~BatchOrchestrator();

    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

    int concurrency() const noexcept { return concurrency_; }

    // Returns at once. For every pair the channel receives a Progress and a
    // Result event, in completion order; a single Done event follows the
    // last one. Throws std::runtime_error after shutdown().
    std::shared_ptr<EventChannel> run(const std::vector<FilePair>& pairs,
                                      const ConversionParameters& params,
                                      bool backupEnabled);

    // Blocks until every task dispatched so far has resolved; rethrows the
    // first task failure, if any.
    void wait();

    // refuses further batches, lets queued and running conversions finish
    void shutdown() noexcept;

private:
    std::vector<std::future<void>> takePending();

    int                            concurrency_;
    ThreadPool                     pool_;
    std::mutex                     mutex_;
    std::vector<std::future<void>> pending_;
    bool                           stopped_ = false;
};

// Convenience wrapper for callers without an event loop: runs the batch,
// hands every event to onEvent on the calling thread and returns once
// Done has been seen.
BatchSummary runBatch(const std::vector<FilePair>& pairs,
                      const ConversionParameters& params,
                      bool backupEnabled,
                      int concurrency,
                      const std::function<void(const BatchEvent&)>& onEvent);

} // namespace dat_toolkit
