// Flowmap - Animation Batcher Implementation

#include <flowmap/animation_batcher.h>
#include <flowmap/performance_monitor.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <iterator>
#include <memory>

namespace flowmap {

BatchSettings batchSettingsFor(HostProfile profile, bool lowMemory) {
    BatchSettings s;
    if (profile == HostProfile::Constrained) {
        s.batchSize = 2;
        s.batchDelayMs = 100.0;
    } else {
        s.batchSize = 5;
        s.batchDelayMs = 50.0;
    }
    s.staggerDelayMs = std::floor(s.batchDelayMs / 2.0);

    if (lowMemory) {
        s.batchSize = std::max<size_t>(1, s.batchSize / 2);
        s.batchDelayMs *= 2.0;
    }
    return s;
}

AnimationBatcher::AnimationBatcher(RunLoop& loop, const PerformanceMonitor* monitor)
    : m_loop(loop), m_monitor(monitor) {}

AnimationBatcher::~AnimationBatcher() {
    clear();
}

void AnimationBatcher::enqueue(std::function<void()> callback, int priority) {
    push(BatchEntry{std::move(callback), priority, m_loop.now(), false});
}

void AnimationBatcher::enqueueDecorative(std::function<void()> callback, int priority) {
    push(BatchEntry{std::move(callback), priority, m_loop.now(), true});
}

void AnimationBatcher::push(BatchEntry entry) {
    m_queue.push_back(std::move(entry));
    if (m_processing || m_startTimer != 0) return;

    // Start on the next timer turn so a burst of enqueues fills whole batches
    m_startTimer = m_loop.setTimeout([this]() {
        m_startTimer = 0;
        process();
    }, 0.0);
}

void AnimationBatcher::configure(const BatchSettings& settings) {
    m_settings = settings;
    if (m_settings.batchSize == 0) m_settings.batchSize = 1;
    if (m_settings.batchDelayMs < 0.0) m_settings.batchDelayMs = 0.0;
    if (m_settings.staggerDelayMs < 0.0) m_settings.staggerDelayMs = 0.0;
}

void AnimationBatcher::clear() {
    const size_t dropped = m_queue.size() + m_staggerTimers.size();
    m_queue.clear();
    for (TimerId id : m_staggerTimers) {
        m_loop.clearTimeout(id);
    }
    m_staggerTimers.clear();
    if (m_batchTimer != 0) {
        m_loop.clearTimeout(m_batchTimer);
        m_batchTimer = 0;
    }
    if (m_startTimer != 0) {
        m_loop.clearTimeout(m_startTimer);
        m_startTimer = 0;
    }
    m_processing = false;

    if (dropped > 0) {
        std::cout << "[AnimationBatcher] Cleared " << dropped << " pending callback(s)\n";
    }
}

void AnimationBatcher::process() {
    if (m_processing || m_queue.empty()) return;
    m_processing = true;

    // Highest priority first, FIFO among equal priorities
    std::stable_sort(m_queue.begin(), m_queue.end(),
                     [](const BatchEntry& a, const BatchEntry& b) { return a.priority > b.priority; });

    const size_t count = std::min(m_settings.batchSize, m_queue.size());
    std::vector<BatchEntry> batch(std::make_move_iterator(m_queue.begin()),
                                  std::make_move_iterator(m_queue.begin() + count));
    m_queue.erase(m_queue.begin(), m_queue.begin() + count);

    ++m_stats.batches;
    m_batchSizes.push_back(count);
    while (m_batchSizes.size() > BATCH_HISTORY_SIZE) {
        m_batchSizes.pop_front();
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        // The timer id is only known after scheduling, so route it through a shared slot
        auto slot = std::make_shared<TimerId>(0);
        *slot = m_loop.setTimeout([this, slot, entry = std::move(batch[i])]() { run(*slot, entry); },
                                  static_cast<double>(i) * m_settings.staggerDelayMs);
        m_staggerTimers.push_back(*slot);
    }

    m_batchTimer = m_loop.setTimeout([this]() {
        m_batchTimer = 0;
        m_processing = false;
        process();
    }, m_settings.batchDelayMs);
}

void AnimationBatcher::run(TimerId timer, const BatchEntry& entry) {
    m_staggerTimers.erase(std::remove(m_staggerTimers.begin(), m_staggerTimers.end(), timer),
                          m_staggerTimers.end());

    if (entry.decorative && m_monitor && m_monitor->isLowPerformance()) {
        ++m_stats.skipped;
        return;
    }

    ++m_stats.dispatched;
    if (!entry.callback) return;

    try {
        entry.callback();
    } catch (const std::exception& e) {
        ++m_stats.failed;
        std::cerr << "[AnimationBatcher] Callback error: " << e.what() << "\n";
    } catch (...) {
        ++m_stats.failed;
        std::cerr << "[AnimationBatcher] Callback error: unknown exception\n";
    }
}

} // namespace flowmap
