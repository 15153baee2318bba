#ifndef RENDERER_H
#define RENDERER_H

#include <vector>
#include "../shape/Polygon.h"
#include "../color/Difference.h"

/**
 * Interface for composite rendering of a polygon population
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    /**
     * Rasterize the population back to front onto a blank canvas
     *
     * @param polygons Population in draw order
     * @param width Canvas width
     * @param height Canvas height
     * @param out Receives width*height*4 interleaved RGBA bytes
     */
    virtual void Render(const std::vector<Polygon>& polygons, int width, int height, pixel_buffer& out) = 0;
};

#endif // RENDERER_H
