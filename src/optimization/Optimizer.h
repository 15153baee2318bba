#ifndef OPTIMIZER_H
#define OPTIMIZER_H

#include <string>
#include <vector>
#include "StatsSink.h"
#include "../shape/Polygon.h"
#include "../color/Difference.h"
#include "../target/TargetImage.h"

class Renderer;
class RandomSource;

/**
 * Population size, mutation granularity and stopping policy of one run
 */
struct OptimizerSettings {
    int polygon_count = 100;
    int vertex_count = 3;
    e_mutation_mode mutation_mode = E_MUTATION_SINGLE;
    unsigned long long max_rounds = 0;        // 0 = unlimited
    double target_match = 0.0;                // 0 = disabled
    unsigned long long stagnation_rounds = 0; // 0 = disabled
};

/**
 * Statistics about attempted mutations
 */
struct MutationStats {
    unsigned long long success_count[E_MUTATION_KIND_MAX] = {};
    unsigned long long attempt_count[E_MUTATION_KIND_MAX] = {};
};

/**
 * Stochastic hill climber over a fixed polygon population.
 *
 * Each round mutates the polygon at the round-robin cursor, renders the whole
 * population and keeps the mutation only if the match strictly improves.
 * The best match therefore never decreases. One instance per run.
 */
class Optimizer {
public:
    /**
     * @param target Target picture, must outlive the optimizer
     * @param renderer Composite renderer, must outlive the optimizer
     * @param rng Random source of the run
     * @param settings Population and stopping settings
     * @throws InvalidArgumentError for non-positive dimensions or population settings
     * @throws DimensionMismatchError when the target buffer is not width*height*4 bytes
     */
    Optimizer(const TargetImage& target, Renderer& renderer, RandomSource& rng, const OptimizerSettings& settings);

    /**
     * Generate the random initial population and reset all counters
     */
    void Initialize();

    /**
     * Run one mutate, render, score, accept-or-reject round
     *
     * @return True if the mutation was accepted (breakthrough)
     * @throws DimensionMismatchError when the renderer produced a buffer of the wrong size
     */
    bool RunRound();

    /**
     * Request the run to stop; IsFinished() turns true
     */
    void Stop();

    bool IsFinished() const { return m_finished; }
    const std::string& GetFinishReason() const { return m_finish_reason; }

    void SetStatsSink(StatsSink* sink) { m_stats_sink = sink; }

    double GetLastMatch() const { return m_last_match; }
    distance_accum_t GetMaxDifference() const { return m_max_difference; }
    int GetNextMutable() const { return m_next_mutable; }
    unsigned long long GetMutations() const { return m_mutations; }
    unsigned long long GetBreakthroughs() const { return m_breakthroughs; }
    unsigned long long GetRoundsSinceImprovement() const { return m_rounds_since_improvement; }
    const MutationStats& GetMutationStats() const { return m_mutation_stats; }

    const std::vector<Polygon>& GetPolygons() const { return m_polygons; }
    int GetWidth() const { return m_target.width; }
    int GetHeight() const { return m_target.height; }

    // Composite of the last accepted population (empty before the first breakthrough)
    const pixel_buffer& GetBestRendering() const { return m_best_canvas; }

    // Difference overlay between target and best composite
    pixel_buffer GetBestDifferenceMap() const;

private:
    void MarkFinished(const char* reason);
    void CheckStopPolicy();

private:
    const TargetImage& m_target;
    Renderer& m_renderer;
    RandomSource& m_rng;
    OptimizerSettings m_settings;
    StatsSink* m_stats_sink; // not owned

    std::vector<Polygon> m_polygons;
    pixel_buffer m_canvas;
    pixel_buffer m_best_canvas;

    double m_last_match;
    distance_accum_t m_max_difference;
    int m_next_mutable;
    unsigned long long m_mutations;
    unsigned long long m_breakthroughs;
    unsigned long long m_rounds_since_improvement;
    MutationStats m_mutation_stats;

    bool m_finished;
    std::string m_finish_reason;
};

#endif // OPTIMIZER_H
