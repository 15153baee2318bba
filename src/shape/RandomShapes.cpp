#include "RandomShapes.h"
#include "../rng/RandomSource.h"
#include "../core/Errors.h"

Point RandomPoint(RandomSource& rng, int maxX, int maxY)
{
    if (maxX <= 0 || maxY <= 0)
        throw InvalidArgumentError("RandomPoint: bounds must be positive");
    Point p;
    p.x = rng.Random(maxX);
    p.y = rng.Random(maxY);
    return p;
}

std::vector<Point> RandomPoints(RandomSource& rng, int count, int maxX, int maxY)
{
    if (count < 0)
        throw InvalidArgumentError("RandomPoints: negative point count");
    if (maxX <= 0 || maxY <= 0)
        throw InvalidArgumentError("RandomPoints: bounds must be positive");
    std::vector<Point> points;
    points.reserve(count);
    for (int i = 0; i < count; ++i)
        points.push_back(RandomPoint(rng, maxX, maxY));
    return points;
}

rgba RandomColor(RandomSource& rng)
{
    rgba c;
    c.r = (unsigned char)rng.Random(256);
    c.g = (unsigned char)rng.Random(256);
    c.b = (unsigned char)rng.Random(256);
    c.a = (unsigned char)rng.Random(256);
    return c;
}
