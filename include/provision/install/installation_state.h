#pragma once

#include <cstdint>
#include <future>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <provision/core/types.h>

namespace provision::install {

enum class InstallPhase : uint8_t {
    NotStarted,
    InProgress,
    Succeeded,
    Failed,
    Cancelled,
};

const char* installPhaseName(InstallPhase phase) noexcept;

/**
 * @brief Point-in-time view of one installation attempt.
 *
 * Always carries exactly these five fields. While an attempt runs,
 * `duration` is the elapsed time so far; afterwards it is the stored
 * terminal value.
 */
struct InstallStatus {
    bool inProgress{false};
    std::optional<bool> outcome;
    std::optional<Error> error;
    std::optional<TimePoint> startedAt;
    std::optional<Duration> duration;
};

/// {"in_progress","outcome","error","started_at","duration"}; started_at is ISO-8601 UTC,
/// duration is seconds.
nlohmann::json toJson(const InstallStatus& status);

/**
 * @brief Lifecycle record of the current attempt.
 *
 * Not synchronized; the owner serializes every call behind one mutex.
 *
 * Invariants:
 * - inProgress implies !outcome; outcome implies !inProgress
 * - error is set iff outcome == false
 * - duration is written once per attempt, at the terminal transition
 * - worker is present iff the attempt runs in background mode
 */
struct InstallationState {
    bool inProgress{false};
    std::optional<bool> outcome;
    std::optional<Error> error;
    std::optional<TimePoint> startedAt;
    std::optional<MonotonicTimePoint> startedAtMonotonic;
    std::optional<Duration> duration;
    bool cancelRequested{false};
    std::optional<std::shared_future<void>> worker;

    /// Resets the previous attempt and enters InProgress.
    void beginAttempt(TimePoint wallNow, MonotonicTimePoint monoNow,
                      std::optional<std::shared_future<void>> workerHandle);

    /// Terminal transition. Returns false (and changes nothing) when no attempt is running.
    bool complete(std::optional<Error> failure, MonotonicTimePoint monoNow);

    InstallPhase phase() const noexcept;

    InstallStatus snapshot(MonotonicTimePoint monoNow) const;

    bool isBackground() const noexcept { return worker.has_value(); }

private:
    Duration elapsedSince(MonotonicTimePoint monoNow) const;
};

} // namespace provision::install
