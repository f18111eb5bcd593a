#include "planner.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace {

void ValidateBounds(const char *name, const PhaseBounds &b) {
    if (b.min_seconds <= 0 || b.step_seconds < 0) {
        throw ValidationError(fmt::format("planner.{}: min must be positive, step not negative",
                                          name));
    }
    if (b.min_seconds > b.default_seconds || b.default_seconds > b.max_seconds) {
        throw ValidationError(fmt::format("planner.{}: expected min <= default <= max", name));
    }
}

// Breaks are never planned below the floor, so a max under it has no valid value
void ValidateBreakFloor(const char *name, const PhaseBounds &b) {
    if (b.max_seconds < MIN_BREAK_SECONDS) {
        throw ValidationError(
            fmt::format("planner.{}: max must be at least {} s", name, MIN_BREAK_SECONDS));
    }
}

} // namespace

// ─────────────────────────────────────
AdaptivePlanner::AdaptivePlanner(PlannerConfig config) : m_Config(config) {
    Validate(m_Config);
}

// ─────────────────────────────────────
void AdaptivePlanner::Validate(const PlannerConfig &config) {
    if (config.history_size < 1) {
        throw ValidationError("planner.history_size must be at least 1");
    }
    if (config.low_threshold < 0.0 || config.high_threshold > 1.0 ||
        config.low_threshold > config.high_threshold) {
        throw ValidationError("planner thresholds must satisfy 0 <= low <= high <= 1");
    }
    if (config.focus_shorten_seconds < 0) {
        throw ValidationError("planner.focus.shorten must not be negative");
    }
    ValidateBounds("focus", config.focus);
    ValidateBounds("short_break", config.short_break);
    ValidateBounds("long_break", config.long_break);
    ValidateBreakFloor("short_break", config.short_break);
    ValidateBreakFloor("long_break", config.long_break);
}

// ─────────────────────────────────────
const PhaseBounds &AdaptivePlanner::Bounds(Phase phase) const {
    switch (phase) {
    case SHORT_BREAK:
        return m_Config.short_break;
    case LONG_BREAK:
        return m_Config.long_break;
    case FOCUS:
    default:
        return m_Config.focus;
    }
}

// ─────────────────────────────────────
std::optional<double>
AdaptivePlanner::ConsistencyRatio(const std::vector<SessionRecord> &history) const {
    const size_t window = static_cast<size_t>(m_Config.history_size);
    const size_t first = history.size() > window ? history.size() - window : 0;

    int attempted = 0;
    int completed = 0;
    for (size_t i = first; i < history.size(); i++) {
        if (history[i].phase != FOCUS) {
            continue;
        }
        attempted++;
        if (history[i].completed) {
            completed++;
        }
    }

    if (attempted == 0) {
        return std::nullopt;
    }
    return static_cast<double>(completed) / attempted;
}

// ─────────────────────────────────────
int AdaptivePlanner::Plan(Phase phase, const std::vector<SessionRecord> &history) const {
    const PhaseBounds &b = Bounds(phase);
    int lo = b.min_seconds;
    if (IsBreak(phase)) {
        lo = std::max(lo, MIN_BREAK_SECONDS);
    }
    const int hi = std::max(lo, b.max_seconds);

    if (!m_Config.enabled) {
        return std::clamp(b.default_seconds, lo, hi);
    }

    const auto ratio = ConsistencyRatio(history);
    if (!ratio) {
        return std::clamp(b.default_seconds, lo, hi);
    }

    int seconds = b.default_seconds;
    if (*ratio >= m_Config.high_threshold) {
        // Consistent: longer focus, shorter breaks
        seconds += phase == FOCUS ? b.step_seconds : -b.step_seconds;
    } else if (*ratio <= m_Config.low_threshold) {
        seconds += phase == FOCUS ? -m_Config.focus_shorten_seconds : b.step_seconds;
    }

    const int planned = std::clamp(seconds, lo, hi);
    spdlog::debug("Planner: phase={}, ratio={:.2f}, planned={}s", PhaseName(phase), *ratio,
                  planned);
    return planned;
}
