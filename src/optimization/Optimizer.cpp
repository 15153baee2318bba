#include "Optimizer.h"
#include "../render/Renderer.h"
#include "../rng/RandomSource.h"
#include "../shape/RandomShapes.h"
#include "../core/Errors.h"
#include "../core/debug_log.h"

Optimizer::Optimizer(const TargetImage& target, Renderer& renderer, RandomSource& rng, const OptimizerSettings& settings)
    : m_target(target)
    , m_renderer(renderer)
    , m_rng(rng)
    , m_settings(settings)
    , m_stats_sink(nullptr)
    , m_last_match(0.0)
    , m_max_difference(1)
    , m_next_mutable(0)
    , m_mutations(0)
    , m_breakthroughs(0)
    , m_rounds_since_improvement(0)
    , m_finished(false)
{
    if (m_target.width <= 0 || m_target.height <= 0)
        throw InvalidArgumentError("Optimizer: target dimensions must be positive");
    if (m_settings.polygon_count < 1)
        throw InvalidArgumentError("Optimizer: polygon count must be at least 1");
    if (m_settings.vertex_count < 3)
        throw InvalidArgumentError("Optimizer: vertex count must be at least 3");
    if (m_target.pixels.size() != (size_t)m_target.width * m_target.height * 4)
        throw DimensionMismatchError("Optimizer: target buffer does not match its dimensions");

    m_max_difference = MaxDifference(m_target.width, m_target.height);
}

void Optimizer::Initialize()
{
    m_polygons.clear();
    m_polygons.reserve(m_settings.polygon_count);
    for (int i = 0; i < m_settings.polygon_count; ++i)
    {
        m_polygons.emplace_back(
            RandomPoints(m_rng, m_settings.vertex_count, m_target.width, m_target.height),
            RandomColor(m_rng));
    }

    m_canvas.clear();
    m_best_canvas.clear();
    m_last_match = 0.0;
    m_next_mutable = 0;
    m_mutations = 0;
    m_breakthroughs = 0;
    m_rounds_since_improvement = 0;
    m_mutation_stats = MutationStats();
    m_finished = false;
    m_finish_reason.clear();

    DBG_PRINT("[OPT] Initialized %d polygons x %d vertices on %dx%d, max difference %lld",
        m_settings.polygon_count, m_settings.vertex_count, m_target.width, m_target.height,
        (long long)m_max_difference);
}

bool Optimizer::RunRound()
{
    if (m_polygons.empty())
        Initialize();

    Polygon& poly = m_polygons[m_next_mutable];
    poly.Stash();
    poly.Mutate(m_rng, m_target.width, m_target.height, m_settings.mutation_mode);
    const e_mutation_kind kind = poly.GetLastMutationKind();
    ++m_mutation_stats.attempt_count[kind];

    m_renderer.Render(m_polygons, m_target.width, m_target.height, m_canvas);
    if (m_canvas.size() != m_target.pixels.size())
    {
        poly.Pop();
        MarkFinished("dimension_mismatch");
        throw DimensionMismatchError("Rendered canvas does not match the target image size");
    }

    const double match = MatchPercentage(PixelDifference(m_target.pixels, m_canvas), m_max_difference);
    const bool accepted = match > m_last_match;
    if (accepted)
    {
        m_last_match = match;
        ++m_breakthroughs;
        ++m_mutation_stats.success_count[kind];
        m_rounds_since_improvement = 0;
        poly.Commit();
        m_best_canvas.swap(m_canvas);
    }
    else
    {
        ++m_rounds_since_improvement;
        poly.Pop();
    }

    ++m_mutations;

    if (++m_next_mutable >= (int)m_polygons.size())
        m_next_mutable = 0;

    if (m_stats_sink)
    {
        RoundStats stats;
        stats.match = match;
        stats.last_match = m_last_match;
        stats.breakthroughs = m_breakthroughs;
        stats.mutations = m_mutations;
        stats.accepted = accepted;
        m_stats_sink->OnRoundCompleted(stats);
    }

    CheckStopPolicy();
    return accepted;
}

void Optimizer::CheckStopPolicy()
{
    if (m_finished)
        return;
    if (m_settings.max_rounds > 0 && m_mutations >= m_settings.max_rounds)
        MarkFinished("max_rounds");
    else if (m_settings.target_match > 0.0 && m_last_match >= m_settings.target_match)
        MarkFinished("target_match");
    else if (m_settings.stagnation_rounds > 0 && m_rounds_since_improvement >= m_settings.stagnation_rounds)
        MarkFinished("stagnation");
}

void Optimizer::Stop()
{
    MarkFinished("stop_requested");
}

void Optimizer::MarkFinished(const char* reason)
{
    if (m_finished)
        return;
    m_finished = true;
    m_finish_reason = reason;
    DBG_PRINT("[OPT] Finished: reason='%s' mutations=%llu breakthroughs=%llu match=%.4f",
        reason, m_mutations, m_breakthroughs, m_last_match);
}

pixel_buffer Optimizer::GetBestDifferenceMap() const
{
    if (m_best_canvas.empty())
        return pixel_buffer(m_target.pixels.size(), 0);
    return VisualizeDifference(m_target.pixels, m_best_canvas);
}
