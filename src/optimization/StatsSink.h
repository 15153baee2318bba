#ifndef STATS_SINK_H
#define STATS_SINK_H

/**
 * Result of one optimizer round
 */
struct RoundStats {
    double match = 0.0;                  // score of this round's candidate
    double last_match = 0.0;             // best score so far
    unsigned long long breakthroughs = 0;
    unsigned long long mutations = 0;
    bool accepted = false;
};

/**
 * Optional observer of optimizer progress (UI, console, tests).
 * Must not influence the optimization.
 */
class StatsSink {
public:
    virtual ~StatsSink() = default;
    virtual void OnRoundCompleted(const RoundStats& stats) = 0;
};

#endif // STATS_SINK_H
