#ifndef POLYGON_H
#define POLYGON_H

#include <cstddef>
#include <vector>
#include "Point.h"
#include "../color/rgba.h"

class RandomSource;

// Granularity of a single Mutate() call
enum e_mutation_mode {
	E_MUTATION_SINGLE, // one vertex or the color
	E_MUTATION_ALL,    // every vertex and the color
};

// What the last Mutate() call changed
enum e_mutation_kind {
	E_MUTATE_VERTEX,
	E_MUTATE_COLOR,
	E_MUTATE_ALL,
	E_MUTATION_KIND_MAX
};

extern const char* mutation_kind_names[E_MUTATION_KIND_MAX];

/**
 * Ordered vertex list plus a uniform fill color.
 *
 * Mutations are speculative: Stash() takes a snapshot and moves the polygon
 * to the pending state, Mutate() is only legal while pending, and the trial
 * ends with either Commit() (keep) or Pop() (restore the snapshot).
 * The vertex count never changes after construction.
 */
class Polygon {
public:
    enum class State { Clean, PendingMutation };

    /**
     * @param points Vertices in draw order, at least 3
     * @param color Fill color
     * @throws InvalidArgumentError when points is empty or holds fewer than 3 vertices
     */
    Polygon(const std::vector<Point>& points, const rgba& color);

    /**
     * Apply one random perturbation in place
     *
     * @param rng Random source of the run
     * @param maxX Exclusive upper bound for new vertex x
     * @param maxY Exclusive upper bound for new vertex y
     * @param mode Mutation granularity
     * @throws NoSnapshotError when called without a prior Stash()
     */
    void Mutate(RandomSource& rng, int maxX, int maxY, e_mutation_mode mode = E_MUTATION_SINGLE);

    /**
     * Snapshot points and color, overwriting any previous snapshot
     */
    void Stash();

    /**
     * Restore the stashed snapshot
     *
     * @throws NoSnapshotError when nothing is stashed
     */
    void Pop();

    /**
     * Keep the current state and drop the snapshot
     *
     * @throws NoSnapshotError when nothing is stashed
     */
    void Commit();

    const std::vector<Point>& GetPoints() const { return m_points; }
    const rgba& GetColor() const { return m_color; }
    size_t GetVertexCount() const { return m_points.size(); }
    State GetState() const { return m_state; }
    bool HasPendingMutation() const { return m_state == State::PendingMutation; }
    e_mutation_kind GetLastMutationKind() const { return m_last_mutation; }

private:
    struct Snapshot {
        std::vector<Point> points;
        rgba color;
    };

    std::vector<Point> m_points;
    rgba m_color;
    State m_state;
    Snapshot m_snapshot;
    e_mutation_kind m_last_mutation;
};

#endif // POLYGON_H
