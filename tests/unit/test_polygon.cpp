#include "shape/Polygon.h"
#include "rng/RandomSource.h"
#include "core/Errors.h"

#include <doctest/doctest.h>

namespace {

Polygon make_triangle()
{
    std::vector<Point> pts = { {1, 1}, {8, 2}, {4, 9} };
    rgba c = { 10, 20, 30, 40 };
    return Polygon(pts, c);
}

size_t changed_vertices(const std::vector<Point>& a, const std::vector<Point>& b)
{
    size_t n = 0;
    for (size_t i = 0; i < a.size(); ++i)
        if (a[i] != b[i]) ++n;
    return n;
}

} // namespace

TEST_SUITE_BEGIN("poly.polygon");

TEST_CASE("construction_rejects_empty_and_degenerate") {
    rgba c = { 0, 0, 0, 255 };
    CHECK_THROWS_AS(Polygon(std::vector<Point>(), c), InvalidArgumentError);
    std::vector<Point> two = { {0, 0}, {1, 1} };
    CHECK_THROWS_AS(Polygon(two, c), InvalidArgumentError);

    Polygon poly = make_triangle();
    CHECK(poly.GetVertexCount() == 3);
    CHECK(poly.GetState() == Polygon::State::Clean);
    CHECK_FALSE(poly.HasPendingMutation());
}

TEST_CASE("operations_without_snapshot_fail") {
    RandomSource rng(1);
    Polygon poly = make_triangle();
    CHECK_THROWS_AS(poly.Mutate(rng, 10, 10), NoSnapshotError);
    CHECK_THROWS_AS(poly.Pop(), NoSnapshotError);
    CHECK_THROWS_AS(poly.Commit(), NoSnapshotError);
}

TEST_CASE("stash_mutate_pop_restores_exactly") {
    RandomSource rng(2);
    Polygon poly = make_triangle();
    const std::vector<Point> points = poly.GetPoints();
    const rgba color = poly.GetColor();

    for (int i = 0; i < 50; ++i) {
        poly.Stash();
        CHECK(poly.GetState() == Polygon::State::PendingMutation);
        poly.Mutate(rng, 10, 10, (i % 2) ? E_MUTATION_ALL : E_MUTATION_SINGLE);
        poly.Pop();
        CHECK(poly.GetState() == Polygon::State::Clean);
        CHECK(poly.GetPoints() == points);
        CHECK(poly.GetColor() == color);
    }
    CHECK_THROWS_AS(poly.Pop(), NoSnapshotError);
}

TEST_CASE("commit_keeps_mutation") {
    RandomSource rng(3);
    Polygon poly = make_triangle();
    poly.Stash();
    poly.Mutate(rng, 10, 10, E_MUTATION_ALL);
    const std::vector<Point> mutated = poly.GetPoints();
    const rgba color = poly.GetColor();
    poly.Commit();
    CHECK(poly.GetState() == Polygon::State::Clean);
    CHECK(poly.GetPoints() == mutated);
    CHECK(poly.GetColor() == color);
    CHECK_THROWS_AS(poly.Pop(), NoSnapshotError);
}

TEST_CASE("second_stash_overwrites_first") {
    RandomSource rng(4);
    Polygon poly = make_triangle();
    poly.Stash();
    poly.Mutate(rng, 10, 10, E_MUTATION_ALL);
    const std::vector<Point> after_first = poly.GetPoints();
    const rgba color_after_first = poly.GetColor();
    poly.Stash();
    poly.Mutate(rng, 10, 10, E_MUTATION_ALL);
    poly.Pop();
    CHECK(poly.GetPoints() == after_first);
    CHECK(poly.GetColor() == color_after_first);
}

TEST_CASE("single_mutation_changes_one_component") {
    RandomSource rng(5);
    Polygon poly = make_triangle();
    bool saw_vertex = false;
    bool saw_color = false;
    for (int i = 0; i < 400; ++i) {
        const std::vector<Point> before = poly.GetPoints();
        const rgba color = poly.GetColor();
        poly.Stash();
        poly.Mutate(rng, 10, 10, E_MUTATION_SINGLE);

        const e_mutation_kind kind = poly.GetLastMutationKind();
        if (kind == E_MUTATE_VERTEX) {
            saw_vertex = true;
            CHECK(changed_vertices(before, poly.GetPoints()) <= 1);
            CHECK(poly.GetColor() == color);
        } else {
            REQUIRE(kind == E_MUTATE_COLOR);
            saw_color = true;
            CHECK(poly.GetPoints() == before);
        }
        for (const Point& p : poly.GetPoints()) {
            CHECK(p.x >= 0);
            CHECK(p.x < 10);
            CHECK(p.y >= 0);
            CHECK(p.y < 10);
        }
        poly.Commit();
        CHECK(poly.GetVertexCount() == 3);
    }
    CHECK(saw_vertex);
    CHECK(saw_color);
}

TEST_CASE("all_mutation_keeps_vertex_count_and_bounds") {
    RandomSource rng(6);
    std::vector<Point> pts = { {0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 0} };
    rgba c = { 1, 2, 3, 4 };
    Polygon poly(pts, c);
    for (int i = 0; i < 20; ++i) {
        poly.Stash();
        poly.Mutate(rng, 3, 2, E_MUTATION_ALL);
        CHECK(poly.GetLastMutationKind() == E_MUTATE_ALL);
        CHECK(poly.GetVertexCount() == 5);
        for (const Point& p : poly.GetPoints()) {
            CHECK(p.x >= 0);
            CHECK(p.x < 3);
            CHECK(p.y >= 0);
            CHECK(p.y < 2);
        }
        poly.Commit();
    }
}

TEST_SUITE_END();
