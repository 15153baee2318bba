#include "SoftwareRenderer.h"
#include "../core/Errors.h"
#include <algorithm>
#include <cmath>

namespace {

struct Crossing {
    double x;
    int winding;
    bool operator<(const Crossing& o) const { return x < o.x; }
};

inline unsigned char mul_div_255(unsigned v, unsigned a)
{
    return (unsigned char)((v * a + 127u) / 255u);
}

inline void blend_px(unsigned char* dst, const rgba& c)
{
    const unsigned a = c.a;
    const unsigned inv = 255u - a;
    dst[0] = (unsigned char)(mul_div_255(c.r, a) + mul_div_255(dst[0], inv));
    dst[1] = (unsigned char)(mul_div_255(c.g, a) + mul_div_255(dst[1], inv));
    dst[2] = (unsigned char)(mul_div_255(c.b, a) + mul_div_255(dst[2], inv));
    dst[3] = 255;
}

} // namespace

void SoftwareRenderer::Render(const std::vector<Polygon>& polygons, int width, int height, pixel_buffer& out)
{
    if (width <= 0 || height <= 0)
        throw InvalidArgumentError("SoftwareRenderer: dimensions must be positive");

    out.assign((size_t)width * height * 4, 255);
    for (const Polygon& polygon : polygons)
        FillPolygon(polygon, width, height, out);
}

void SoftwareRenderer::FillPolygon(const Polygon& polygon, int width, int height, pixel_buffer& canvas)
{
    const rgba& color = polygon.GetColor();
    if (color.a == 0)
        return;

    const std::vector<Point>& pts = polygon.GetPoints();
    const size_t n = pts.size();

    int min_y = pts[0].y, max_y = pts[0].y;
    for (const Point& p : pts)
    {
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    // Rows whose center y+0.5 lies inside [min_y, max_y]
    int y0 = std::max(0, min_y);
    int y1 = std::min(height - 1, max_y);

    std::vector<Crossing> crossings;
    crossings.reserve(n);

    for (int y = y0; y <= y1; ++y)
    {
        const double sy = y + 0.5;
        crossings.clear();
        for (size_t i = 0; i < n; ++i)
        {
            const Point& from = pts[i];
            const Point& to = pts[(i + 1) % n];
            if (from.y == to.y)
                continue;
            // half-open in y so shared vertices are counted once
            if ((from.y <= sy && sy < to.y) || (to.y <= sy && sy < from.y))
            {
                double t = (sy - from.y) / (double)(to.y - from.y);
                Crossing c;
                c.x = from.x + t * (to.x - from.x);
                c.winding = (to.y > from.y) ? 1 : -1;
                crossings.push_back(c);
            }
        }
        if (crossings.size() < 2)
            continue;
        std::sort(crossings.begin(), crossings.end());

        unsigned char* row = canvas.data() + (size_t)y * width * 4;
        int winding = 0;
        for (size_t i = 0; i + 1 < crossings.size(); ++i)
        {
            winding += crossings[i].winding;
            if (winding == 0)
                continue;
            // pixels whose center x+0.5 lies in [xa, xb)
            int xa = (int)std::ceil(crossings[i].x - 0.5);
            int xb = (int)std::ceil(crossings[i + 1].x - 0.5);
            xa = std::max(xa, 0);
            xb = std::min(xb, width);
            for (int x = xa; x < xb; ++x)
                blend_px(row + (size_t)x * 4, color);
        }
    }
}
