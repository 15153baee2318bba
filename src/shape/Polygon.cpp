#include "Polygon.h"
#include "RandomShapes.h"
#include "../rng/RandomSource.h"
#include "../core/Errors.h"

const char* mutation_kind_names[E_MUTATION_KIND_MAX] = {
    "Replace vertex",
    "Replace color",
    "Replace all",
};

Polygon::Polygon(const std::vector<Point>& points, const rgba& color)
    : m_points(points)
    , m_color(color)
    , m_state(State::Clean)
    , m_last_mutation(E_MUTATE_VERTEX)
{
    if (m_points.empty())
        throw InvalidArgumentError("Polygon: empty vertex list");
    if (m_points.size() < 3)
        throw InvalidArgumentError("Polygon: at least 3 vertices required");
    m_snapshot.color = m_color;
}

void Polygon::Mutate(RandomSource& rng, int maxX, int maxY, e_mutation_mode mode)
{
    if (m_state != State::PendingMutation)
        throw NoSnapshotError("Polygon::Mutate called without Stash()");

    if (mode == E_MUTATION_ALL)
    {
        for (auto& p : m_points)
            p = RandomPoint(rng, maxX, maxY);
        m_color = RandomColor(rng);
        m_last_mutation = E_MUTATE_ALL;
        return;
    }

    // N vertices + 1 color slot, each equally likely
    const int n = (int)m_points.size();
    int k = rng.Random(n + 1);
    if (k < n)
    {
        m_points[k] = RandomPoint(rng, maxX, maxY);
        m_last_mutation = E_MUTATE_VERTEX;
    }
    else
    {
        m_color = RandomColor(rng);
        m_last_mutation = E_MUTATE_COLOR;
    }
}

void Polygon::Stash()
{
    m_snapshot.points = m_points;
    m_snapshot.color = m_color;
    m_state = State::PendingMutation;
}

void Polygon::Pop()
{
    if (m_state != State::PendingMutation)
        throw NoSnapshotError("Polygon::Pop called without Stash()");
    m_points.swap(m_snapshot.points);
    m_color = m_snapshot.color;
    m_snapshot.points.clear();
    m_state = State::Clean;
}

void Polygon::Commit()
{
    if (m_state != State::PendingMutation)
        throw NoSnapshotError("Polygon::Commit called without Stash()");
    m_snapshot.points.clear();
    m_state = State::Clean;
}
