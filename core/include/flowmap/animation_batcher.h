#pragma once

/**
 * @file animation_batcher.h
 * @brief Batched, staggered dispatch of small animation callbacks
 *
 * Many visibility flips or decorative updates issued at once can swamp the
 * host. The batcher queues them and dispatches batchSize entries at a time,
 * running entry i of a batch staggerDelayMs * i after the batch starts and
 * starting the next batch batchDelayMs later.
 *
 * @par Example
 * @code
 * AnimationBatcher batcher(loop);
 * batcher.configure({3, 100.0, 10.0});
 * for (auto& id : ids) {
 *     batcher.enqueue([&, id] { overlay.setVisible(id, true); });
 * }
 * @endcode
 */

#include <flowmap/run_loop.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace flowmap {

class PerformanceMonitor;

/**
 * @brief Batch dispatch tuning
 */
struct BatchSettings {
    size_t batchSize = 5;
    double batchDelayMs = 100.0;
    double staggerDelayMs = 20.0;
};

/**
 * @brief Host environment classes with different batch budgets
 */
enum class HostProfile {
    Constrained,  ///< Hosts that crash under many concurrent layer changes
    Standard
};

/**
 * @brief Batch settings tuned for a host profile
 * @param profile Host class
 * @param lowMemory Halve batch size and double the delay
 */
BatchSettings batchSettingsFor(HostProfile profile, bool lowMemory = false);

/**
 * @brief One queued callback
 */
struct BatchEntry {
    std::function<void()> callback;
    int priority = 0;          ///< Higher runs earlier
    double enqueuedAt = 0.0;   ///< Run loop time at enqueue
    bool decorative = false;   ///< Skipped while performance is low
};

/**
 * @brief Counters since construction
 */
struct BatcherStats {
    uint64_t dispatched = 0;  ///< Callbacks that ran (including failed ones)
    uint64_t failed = 0;      ///< Callbacks that threw
    uint64_t skipped = 0;     ///< Decorative callbacks dropped under load
    uint64_t batches = 0;
};

class AnimationBatcher {
public:
    /**
     * @brief Construct a batcher
     * @param loop Run loop providing timers
     * @param monitor Optional monitor consulted for decorative entries
     */
    explicit AnimationBatcher(RunLoop& loop, const PerformanceMonitor* monitor = nullptr);
    ~AnimationBatcher();

    AnimationBatcher(const AnimationBatcher&) = delete;
    AnimationBatcher& operator=(const AnimationBatcher&) = delete;

    /**
     * @brief Queue a callback and start processing if idle
     *
     * Processing starts on the next timer turn, so callbacks enqueued
     * back to back share batches.
     */
    void enqueue(std::function<void()> callback, int priority = 0);

    /// @brief Queue a callback that is dropped while performance is low
    void enqueueDecorative(std::function<void()> callback, int priority = 0);

    /// @brief Drop all pending work and halt processing
    void clear();

    /// @brief Adjust settings; applies from the next batch
    void configure(const BatchSettings& settings);
    const BatchSettings& settings() const { return m_settings; }

    void setMonitor(const PerformanceMonitor* monitor) { m_monitor = monitor; }

    bool isProcessing() const { return m_processing || m_startTimer != 0; }

    /// @brief Entries waiting for a batch
    size_t queued() const { return m_queue.size(); }

    /// @brief Entries dispatched in a batch but not yet run (stagger pending)
    size_t inFlight() const { return m_staggerTimers.size(); }

    const BatcherStats& stats() const { return m_stats; }

    /// @brief Sizes of the most recent batches, oldest first (at most BATCH_HISTORY_SIZE)
    const std::deque<size_t>& batchSizes() const { return m_batchSizes; }

    static constexpr size_t BATCH_HISTORY_SIZE = 64;

private:
    void push(BatchEntry entry);
    void process();
    void run(TimerId timer, const BatchEntry& entry);

    RunLoop& m_loop;
    const PerformanceMonitor* m_monitor = nullptr;
    BatchSettings m_settings;

    std::deque<BatchEntry> m_queue;
    std::vector<TimerId> m_staggerTimers;
    TimerId m_batchTimer = 0;
    TimerId m_startTimer = 0;
    bool m_processing = false;

    BatcherStats m_stats;
    std::deque<size_t> m_batchSizes;
};

} // namespace flowmap
