#include "optimization/Optimizer.h"
#include "render/SoftwareRenderer.h"
#include "rng/RandomSource.h"
#include "core/Errors.h"
#include "test_helpers.h"

#include <doctest/doctest.h>

using namespace PolyTest;

namespace {

// Renders every population as a flat color, independent of the polygons
class FlatRenderer : public Renderer {
public:
    explicit FlatRenderer(rgba c) : m_color(c) {}
    void Render(const std::vector<Polygon>&, int width, int height, pixel_buffer& out) override
    {
        out = flat_target(width, height, m_color).pixels;
        ++calls;
    }
    int calls = 0;
private:
    rgba m_color;
};

class WrongSizeRenderer : public Renderer {
public:
    void Render(const std::vector<Polygon>&, int, int, pixel_buffer& out) override
    {
        out.assign(40, 0);
    }
};

class RecordingSink : public StatsSink {
public:
    void OnRoundCompleted(const RoundStats& stats) override { rounds.push_back(stats); }
    std::vector<RoundStats> rounds;
};

const rgba kWhite = { 255, 255, 255, 255 };
const rgba kBlack = { 0, 0, 0, 255 };

OptimizerSettings small_settings(int polygons)
{
    OptimizerSettings s;
    s.polygon_count = polygons;
    s.vertex_count = 3;
    return s;
}

} // namespace

TEST_SUITE_BEGIN("poly.optimizer");

TEST_CASE("construction_validates_input") {
    SoftwareRenderer renderer;
    RandomSource rng(1);
    TargetImage target = flat_target(4, 4, kWhite);

    TargetImage empty;
    CHECK_THROWS_AS(Optimizer(empty, renderer, rng, small_settings(3)), InvalidArgumentError);
    CHECK_THROWS_AS(Optimizer(target, renderer, rng, small_settings(0)), InvalidArgumentError);

    OptimizerSettings two_vertices = small_settings(3);
    two_vertices.vertex_count = 2;
    CHECK_THROWS_AS(Optimizer(target, renderer, rng, two_vertices), InvalidArgumentError);

    TargetImage short_buffer = target;
    short_buffer.pixels.resize(short_buffer.pixels.size() - 4);
    CHECK_THROWS_AS(Optimizer(short_buffer, renderer, rng, small_settings(3)), DimensionMismatchError);
}

TEST_CASE("initialize_builds_population") {
    SoftwareRenderer renderer;
    RandomSource rng(2);
    TargetImage target = flat_target(7, 5, kWhite);
    OptimizerSettings settings = small_settings(6);
    settings.vertex_count = 4;
    Optimizer opt(target, renderer, rng, settings);
    opt.Initialize();

    REQUIRE(opt.GetPolygons().size() == 6);
    for (const Polygon& poly : opt.GetPolygons()) {
        CHECK(poly.GetVertexCount() == 4);
        CHECK_FALSE(poly.HasPendingMutation());
        for (const Point& p : poly.GetPoints()) {
            CHECK(p.x >= 0);
            CHECK(p.x < 7);
            CHECK(p.y >= 0);
            CHECK(p.y < 5);
        }
    }
    CHECK(opt.GetLastMatch() == 0.0);
    CHECK(opt.GetMaxDifference() == 7 * 5 * 3 * 255);
    CHECK(opt.GetNextMutable() == 0);
    CHECK(opt.GetMutations() == 0);
    CHECK(opt.GetBreakthroughs() == 0);
    CHECK_FALSE(opt.IsFinished());
}

TEST_CASE("rejected_rounds_visit_every_polygon_in_order") {
    // all black against all white scores 0, which never beats lastMatch = 0
    FlatRenderer renderer(kBlack);
    RandomSource rng(3);
    TargetImage target = flat_target(4, 4, kWhite);
    Optimizer opt(target, renderer, rng, small_settings(5));
    opt.Initialize();
    const std::vector<Polygon> before = opt.GetPolygons();

    for (int round = 1; round <= 5; ++round) {
        CHECK_FALSE(opt.RunRound());
        CHECK(opt.GetNextMutable() == round % 5);
    }
    CHECK(opt.GetMutations() == 5);
    CHECK(opt.GetBreakthroughs() == 0);
    CHECK(opt.GetLastMatch() == 0.0);
    CHECK(opt.GetBestRendering().empty());

    const std::vector<Polygon>& after = opt.GetPolygons();
    for (size_t i = 0; i < before.size(); ++i) {
        CHECK(after[i].GetPoints() == before[i].GetPoints());
        CHECK(after[i].GetColor() == before[i].GetColor());
        CHECK_FALSE(after[i].HasPendingMutation());
    }

    const MutationStats& stats = opt.GetMutationStats();
    unsigned long long attempts = 0;
    for (int k = 0; k < E_MUTATION_KIND_MAX; ++k) {
        attempts += stats.attempt_count[k];
        CHECK(stats.success_count[k] == 0);
    }
    CHECK(attempts == 5);
}

TEST_CASE("perfect_render_is_accepted_once") {
    FlatRenderer renderer(kWhite);
    RandomSource rng(4);
    TargetImage target = flat_target(3, 3, kWhite);
    Optimizer opt(target, renderer, rng, small_settings(2));

    // population is created on demand
    CHECK(opt.RunRound());
    CHECK(opt.GetPolygons().size() == 2);
    CHECK(opt.GetLastMatch() == doctest::Approx(100.0));
    CHECK(opt.GetBreakthroughs() == 1);
    CHECK(opt.GetBestRendering() == target.pixels);

    // equal score is not an improvement
    CHECK_FALSE(opt.RunRound());
    CHECK(opt.GetBreakthroughs() == 1);
    CHECK(opt.GetMutations() == 2);
}

TEST_CASE("max_rounds_stops_run") {
    SoftwareRenderer renderer;
    RandomSource rng(5);
    TargetImage target = flat_target(6, 6, kBlack);
    OptimizerSettings settings = small_settings(4);
    settings.max_rounds = 10;
    Optimizer opt(target, renderer, rng, settings);
    opt.Initialize();

    int rounds = 0;
    while (!opt.IsFinished()) {
        opt.RunRound();
        ++rounds;
        REQUIRE(rounds <= 10);
    }
    CHECK(rounds == 10);
    CHECK(opt.GetFinishReason() == "max_rounds");
}

TEST_CASE("target_match_stops_run") {
    FlatRenderer renderer(kWhite);
    RandomSource rng(6);
    TargetImage target = flat_target(3, 3, kWhite);
    OptimizerSettings settings = small_settings(2);
    settings.target_match = 99.0;
    Optimizer opt(target, renderer, rng, settings);
    opt.Initialize();

    opt.RunRound();
    CHECK(opt.IsFinished());
    CHECK(opt.GetFinishReason() == "target_match");
}

TEST_CASE("stagnation_stops_run") {
    FlatRenderer renderer(kBlack);
    RandomSource rng(7);
    TargetImage target = flat_target(3, 3, kWhite);
    OptimizerSettings settings = small_settings(2);
    settings.stagnation_rounds = 7;
    Optimizer opt(target, renderer, rng, settings);
    opt.Initialize();

    for (int i = 0; i < 6; ++i) {
        opt.RunRound();
        CHECK_FALSE(opt.IsFinished());
    }
    opt.RunRound();
    CHECK(opt.IsFinished());
    CHECK(opt.GetFinishReason() == "stagnation");
    CHECK(opt.GetRoundsSinceImprovement() == 7);
}

TEST_CASE("external_stop") {
    SoftwareRenderer renderer;
    RandomSource rng(8);
    TargetImage target = flat_target(3, 3, kWhite);
    Optimizer opt(target, renderer, rng, small_settings(2));
    opt.Initialize();
    opt.RunRound();
    opt.Stop();
    CHECK(opt.IsFinished());
    CHECK(opt.GetFinishReason() == "stop_requested");
}

TEST_CASE("wrong_render_size_aborts_round") {
    WrongSizeRenderer renderer;
    RandomSource rng(9);
    TargetImage target = flat_target(3, 3, kWhite);
    Optimizer opt(target, renderer, rng, small_settings(2));
    opt.Initialize();
    const std::vector<Point> points = opt.GetPolygons()[0].GetPoints();
    const rgba color = opt.GetPolygons()[0].GetColor();

    CHECK_THROWS_AS(opt.RunRound(), DimensionMismatchError);
    CHECK(opt.IsFinished());
    CHECK(opt.GetFinishReason() == "dimension_mismatch");
    CHECK_FALSE(opt.GetPolygons()[0].HasPendingMutation());
    CHECK(opt.GetPolygons()[0].GetPoints() == points);
    CHECK(opt.GetPolygons()[0].GetColor() == color);
    CHECK(opt.GetMutations() == 0);
}

TEST_CASE("stats_sink_sees_every_round") {
    SoftwareRenderer renderer;
    RandomSource rng(10);
    rgba c = { 90, 140, 60, 255 };
    TargetImage target = flat_target(8, 8, c);
    Optimizer opt(target, renderer, rng, small_settings(4));
    RecordingSink sink;
    opt.SetStatsSink(&sink);
    opt.Initialize();

    unsigned long long accepted = 0;
    for (int i = 0; i < 200; ++i)
        if (opt.RunRound())
            ++accepted;

    REQUIRE(sink.rounds.size() == 200);
    for (size_t i = 0; i < sink.rounds.size(); ++i) {
        const RoundStats& r = sink.rounds[i];
        CHECK(r.mutations == i + 1);
        CHECK(r.match <= r.last_match);
        if (r.accepted)
            CHECK(r.match == r.last_match);
    }
    CHECK(sink.rounds.back().breakthroughs == accepted);
    CHECK(sink.rounds.back().last_match == opt.GetLastMatch());
}

TEST_CASE("stats_sink_does_not_change_search") {
    SoftwareRenderer renderer;
    rgba c = { 120, 30, 210, 255 };
    TargetImage target = flat_target(10, 10, c);

    RandomSource plain_rng(77);
    Optimizer plain(target, renderer, plain_rng, small_settings(5));
    plain.Initialize();

    RandomSource observed_rng(77);
    Optimizer observed(target, renderer, observed_rng, small_settings(5));
    RecordingSink sink;
    observed.SetStatsSink(&sink);
    observed.Initialize();

    for (int i = 0; i < 500; ++i)
        CHECK(plain.RunRound() == observed.RunRound());

    CHECK(sink.rounds.size() == 500);
    CHECK(plain.GetLastMatch() == observed.GetLastMatch());
    CHECK(plain.GetBreakthroughs() == observed.GetBreakthroughs());
    REQUIRE(plain.GetPolygons().size() == observed.GetPolygons().size());
    for (size_t i = 0; i < plain.GetPolygons().size(); ++i) {
        CHECK(plain.GetPolygons()[i].GetPoints() == observed.GetPolygons()[i].GetPoints());
        CHECK(plain.GetPolygons()[i].GetColor() == observed.GetPolygons()[i].GetColor());
    }
    CHECK(plain.GetBestRendering() == observed.GetBestRendering());
}

TEST_CASE("difference_map_matches_best_rendering") {
    SoftwareRenderer renderer;
    RandomSource rng(11);
    rgba c = { 30, 200, 120, 255 };
    TargetImage target = flat_target(5, 5, c);
    Optimizer opt(target, renderer, rng, small_settings(3));
    opt.Initialize();
    for (int i = 0; i < 20; ++i)
        opt.RunRound();

    REQUIRE_FALSE(opt.GetBestRendering().empty());
    CHECK(opt.GetBestDifferenceMap() == VisualizeDifference(target.pixels, opt.GetBestRendering()));
    CHECK(MatchPercentage(PixelDifference(target.pixels, opt.GetBestRendering()), opt.GetMaxDifference())
        == doctest::Approx(opt.GetLastMatch()));
}

TEST_CASE("three_triangles_converge_on_flat_target") {
    SoftwareRenderer renderer;
    RandomSource rng(2024);
    rgba c = { 200, 60, 30, 255 };
    TargetImage target = flat_target(10, 10, c);
    OptimizerSettings settings = small_settings(3);
    Optimizer opt(target, renderer, rng, settings);
    opt.Initialize();

    opt.RunRound();
    const double first = opt.GetLastMatch();
    double previous = first;
    for (int i = 1; i < 1000; ++i) {
        opt.RunRound();
        CHECK(opt.GetLastMatch() >= previous);
        previous = opt.GetLastMatch();
    }

    CHECK(opt.GetMutations() == 1000);
    CHECK(opt.GetLastMatch() > first);
    CHECK(opt.GetLastMatch() <= 100.0);
    CHECK(opt.GetBreakthroughs() > 1);
    CHECK_FALSE(opt.IsFinished());
}

TEST_SUITE_END();
