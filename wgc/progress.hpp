#pragma once

#include <atomic>
#include <cstdint>

// =============================================================================
/// @file progress.hpp
/// @brief Percentage counter a long-running job publishes and others poll
///
/// The centrality engine updates it once per round (round / max_rounds, 100
/// once terminal). Readers on other threads never block the writer.
// =============================================================================

namespace wgc::progress {

using ProgressValue = std::uint8_t;

class ProgressHandle {
public:
    ProgressHandle() = default;
    ProgressHandle(const ProgressHandle&) = delete;
    ProgressHandle& operator=(const ProgressHandle&) = delete;

    /// Values above 100 are stored as 100.
    void set(std::uint64_t percent) noexcept {
        value_.store(static_cast<ProgressValue>(percent < 100 ? percent : 100), std::memory_order_release);
    }

    [[nodiscard]] ProgressValue get() const noexcept { return value_.load(std::memory_order_acquire); }

private:
    std::atomic<ProgressValue> value_{0};
};

} // namespace wgc::progress
