#pragma once

#include <vector>

#include "common.hpp"

#define MIN_BREAK_SECONDS 60

// Per phase duration constants, in seconds.
struct PhaseBounds {
    int default_seconds;
    int min_seconds;
    int max_seconds;
    int step_seconds;
};

struct PlannerConfig {
    bool enabled = true;
    int history_size = 10;
    double high_threshold = 0.8;
    double low_threshold = 0.4;
    PhaseBounds focus{1500, 900, 3600, 300};
    int focus_shorten_seconds = 600;
    PhaseBounds short_break{300, 120, 600, 60};
    PhaseBounds long_break{900, 600, 1800, 120};
};

// Picks the duration of the next phase from recent Focus outcomes. Stateless: the same
// history always gives the same answer.
class AdaptivePlanner {
  public:
    explicit AdaptivePlanner(PlannerConfig config = {});

    // `history` is ordered oldest to newest; only the last `history_size` records count.
    int Plan(Phase phase, const std::vector<SessionRecord> &history) const;

    // Completed Focus / attempted Focus over the window, nullopt when no Focus was attempted.
    std::optional<double> ConsistencyRatio(const std::vector<SessionRecord> &history) const;

    const PlannerConfig &Config() const {
        return m_Config;
    }

    static void Validate(const PlannerConfig &config);

  private:
    const PhaseBounds &Bounds(Phase phase) const;

  private:
    PlannerConfig m_Config;
};
