#include <provision/install/installation_state.h>

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace provision::install {

namespace {

std::string formatTimestamp(TimePoint tp) {
    auto timeT = std::chrono::system_clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tmUtc{};
#ifdef _WIN32
    gmtime_s(&tmUtc, &timeT);
#else
    gmtime_r(&timeT, &tmUtc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tmUtc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

} // namespace

const char* installPhaseName(InstallPhase phase) noexcept {
    switch (phase) {
        case InstallPhase::NotStarted:
            return "not_started";
        case InstallPhase::InProgress:
            return "in_progress";
        case InstallPhase::Succeeded:
            return "succeeded";
        case InstallPhase::Failed:
            return "failed";
        case InstallPhase::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

void InstallationState::beginAttempt(TimePoint wallNow, MonotonicTimePoint monoNow,
                                     std::optional<std::shared_future<void>> workerHandle) {
    outcome.reset();
    error.reset();
    duration.reset();
    cancelRequested = false;
    worker = std::move(workerHandle);
    startedAt = wallNow;
    startedAtMonotonic = monoNow;
    inProgress = true;
}

bool InstallationState::complete(std::optional<Error> failure, MonotonicTimePoint monoNow) {
    if (!inProgress) {
        return false;
    }
    duration = elapsedSince(monoNow);
    outcome = !failure.has_value();
    error = std::move(failure);
    inProgress = false;
    return true;
}

InstallPhase InstallationState::phase() const noexcept {
    if (inProgress) {
        return InstallPhase::InProgress;
    }
    if (!outcome) {
        return InstallPhase::NotStarted;
    }
    if (*outcome) {
        return InstallPhase::Succeeded;
    }
    if (error && error->code == ErrorCode::Cancelled) {
        return InstallPhase::Cancelled;
    }
    return InstallPhase::Failed;
}

InstallStatus InstallationState::snapshot(MonotonicTimePoint monoNow) const {
    InstallStatus status;
    status.inProgress = inProgress;
    status.outcome = outcome;
    status.error = error;
    status.startedAt = startedAt;
    if (inProgress) {
        status.duration = elapsedSince(monoNow);
    } else if (startedAt) {
        status.duration = duration;
    }
    return status;
}

Duration InstallationState::elapsedSince(MonotonicTimePoint monoNow) const {
    if (!startedAtMonotonic || monoNow < *startedAtMonotonic) {
        return Duration::zero();
    }
    return std::chrono::duration_cast<Duration>(monoNow - *startedAtMonotonic);
}

nlohmann::json toJson(const InstallStatus& status) {
    nlohmann::json j;
    j["in_progress"] = status.inProgress;
    j["outcome"] = status.outcome ? nlohmann::json(*status.outcome) : nlohmann::json(nullptr);
    j["error"] = status.error ? nlohmann::json(status.error->message) : nlohmann::json(nullptr);
    j["started_at"] =
        status.startedAt ? nlohmann::json(formatTimestamp(*status.startedAt)) : nlohmann::json(nullptr);
    j["duration"] = status.duration
                        ? nlohmann::json(std::chrono::duration<double>(*status.duration).count())
                        : nlohmann::json(nullptr);
    return j;
}

} // namespace provision::install
