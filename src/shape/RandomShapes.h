#ifndef RANDOM_SHAPES_H
#define RANDOM_SHAPES_H

#include <vector>
#include "Point.h"
#include "../color/rgba.h"

class RandomSource;

/**
 * Generate random vertices in generation order (not sorted, polygons may self-intersect)
 *
 * @param rng Random source of the run
 * @param count Number of points
 * @param maxX Exclusive upper bound for x
 * @param maxY Exclusive upper bound for y
 * @return count points with x in [0,maxX) and y in [0,maxY)
 */
std::vector<Point> RandomPoints(RandomSource& rng, int count, int maxX, int maxY);

// Single random point in [0,maxX) x [0,maxY)
Point RandomPoint(RandomSource& rng, int maxX, int maxY);

// Each channel, alpha included, uniform in [0,255]
rgba RandomColor(RandomSource& rng);

#endif // RANDOM_SHAPES_H
