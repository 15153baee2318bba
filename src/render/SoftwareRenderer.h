#ifndef SOFTWARE_RENDERER_H
#define SOFTWARE_RENDERER_H

#include <vector>
#include "Renderer.h"

/**
 * Scanline polygon rasterizer.
 * Clears to opaque white, fills with the non-zero winding rule sampled at
 * pixel centers and blends source-over with opacity a/255.
 */
class SoftwareRenderer : public Renderer {
public:
    void Render(const std::vector<Polygon>& polygons, int width, int height, pixel_buffer& out) override;

    // Fill one polygon onto an existing canvas
    static void FillPolygon(const Polygon& polygon, int width, int height, pixel_buffer& canvas);
};

#endif // SOFTWARE_RENDERER_H
