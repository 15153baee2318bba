#include "OutputManager.h"
#include "ImageProcessor.h"
#include "../optimization/Optimizer.h"
#include "../core/debug_log.h"

#include <iostream>
#include <cstdio>

OutputManager::OutputManager()
    : m_width(0)
    , m_height(0)
{
}

void OutputManager::Initialize(const std::string& outputFile, int width, int height)
{
    m_outputFile = outputFile;
    m_width = width;
    m_height = height;
}

std::string OutputManager::DeriveFileName(const std::string& suffix) const
{
    std::string base = m_outputFile;
    size_t dot = base.find_last_of('.');
    size_t slash = base.find_last_of("/\\");
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash))
        base = base.substr(0, dot);
    return base + suffix;
}

bool OutputManager::SavePicture(const std::string& filename, FIBITMAP* to_save)
{
    FIBITMAP* flipped = FreeImage_Clone(to_save);
    if (!flipped)
    {
        std::cerr << "Error saving picture: " << filename << std::endl;
        return false;
    }

    // FreeImage stores bottom-up
    FreeImage_FlipVertical(flipped);

    bool ok = FreeImage_Save(FIF_PNG, flipped, filename.c_str()) != 0;
    if (!ok)
        std::cerr << "Error saving picture: " << filename << std::endl;
    FreeImage_Unload(flipped);
    return ok;
}

bool OutputManager::SavePicture(const std::string& filename, const pixel_buffer& rgba)
{
    FIBITMAP* bitmap = ImageProcessor::CreateBitmap(rgba, m_width, m_height);
    if (!bitmap)
    {
        std::cerr << "Error saving picture: " << filename << std::endl;
        return false;
    }
    bool ok = SavePicture(filename, bitmap);
    FreeImage_Unload(bitmap);
    return ok;
}

bool OutputManager::SaveSvg(const std::string& filename, const std::vector<Polygon>& polygons)
{
    FILE* fp = fopen(filename.c_str(), "wt");
    if (!fp) {
        std::cerr << "Error saving SVG: " << filename << std::endl;
        return false;
    }

    fprintf(fp, "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%d\" height=\"%d\" viewBox=\"0 0 %d %d\">\n",
        m_width, m_height, m_width, m_height);
    fprintf(fp, "<rect width=\"%d\" height=\"%d\" fill=\"#ffffff\"/>\n", m_width, m_height);

    for (const Polygon& poly : polygons)
    {
        const rgba& c = poly.GetColor();
        fprintf(fp, "<polygon fill=\"#%02x%02x%02x\" fill-opacity=\"%.4f\" fill-rule=\"nonzero\" points=\"",
            c.r, c.g, c.b, c.a / 255.0);
        const std::vector<Point>& points = poly.GetPoints();
        for (size_t i = 0; i < points.size(); ++i)
            fprintf(fp, "%s%d,%d", i ? " " : "", points[i].x, points[i].y);
        fprintf(fp, "\"/>\n");
    }
    fprintf(fp, "</svg>\n");

    bool ok = ferror(fp) == 0;
    fclose(fp);
    return ok;
}

bool OutputManager::SavePolygons(const std::string& filename,
                                 const std::vector<Polygon>& polygons,
                                 const std::string& cmdLine,
                                 const std::string& inputFile,
                                 unsigned long long seed,
                                 unsigned long long rounds,
                                 unsigned long long breakthroughs,
                                 double match)
{
    FILE* fp = fopen(filename.c_str(), "wt");
    if (!fp) {
        std::cerr << "Error saving polygons: " << filename << std::endl;
        return false;
    }

    fprintf(fp, "; ---------------------------------- \n");
    fprintf(fp, "; PolyConverter\n");
    fprintf(fp, "; ---------------------------------- \n");
    fprintf(fp, "; Input: %s\n", inputFile.c_str());
    fprintf(fp, "; CmdLine: %s\n", cmdLine.c_str());
    fprintf(fp, "; Seed: %llu\n", seed);
    fprintf(fp, "; Rounds: %llu\n", rounds);
    fprintf(fp, "; Breakthroughs: %llu\n", breakthroughs);
    fprintf(fp, "; Match: %.4f\n", match);
    fprintf(fp, "; Size: %dx%d\n", m_width, m_height);
    fprintf(fp, "; Polygons: %u\n", (unsigned)polygons.size());
    fprintf(fp, "; ---------------------------------- \n");

    for (const Polygon& poly : polygons)
    {
        const rgba& c = poly.GetColor();
        fprintf(fp, "%d %d %d %d", c.r, c.g, c.b, c.a);
        for (const Point& p : poly.GetPoints())
            fprintf(fp, " %d %d", p.x, p.y);
        fprintf(fp, "\n");
    }

    bool ok = ferror(fp) == 0;
    fclose(fp);
    return ok;
}

namespace {
    // difference overlay (black with alpha) composited over white
    pixel_buffer FlattenOverWhite(const pixel_buffer& overlay)
    {
        pixel_buffer out(overlay.size());
        for (size_t i = 0; i + 3 < overlay.size(); i += 4)
        {
            const unsigned char a = overlay[i + 3];
            for (int c = 0; c < 3; ++c)
                out[i + c] = (unsigned char)(((255 - a) * 255 + overlay[i + c] * a + 127) / 255);
            out[i + 3] = 255;
        }
        return out;
    }
}

bool OutputManager::SaveBestSolution(const Optimizer& optimizer,
                                     const std::string& cmdLine,
                                     const std::string& inputFile,
                                     unsigned long long seed)
{
    bool ok = true;

    if (!optimizer.GetBestRendering().empty())
    {
        ok = SavePicture(m_outputFile, optimizer.GetBestRendering()) && ok;
        ok = SavePicture(DeriveFileName("-diff.png"), FlattenOverWhite(optimizer.GetBestDifferenceMap())) && ok;
    }
    ok = SaveSvg(DeriveFileName(".svg"), optimizer.GetPolygons()) && ok;
    ok = SavePolygons(DeriveFileName(".txt"), optimizer.GetPolygons(), cmdLine, inputFile, seed,
        optimizer.GetMutations(), optimizer.GetBreakthroughs(), optimizer.GetLastMatch()) && ok;

    DBG_PRINT("[OUT] Saved %s (match %.4f, %llu rounds)%s", m_outputFile.c_str(),
        optimizer.GetLastMatch(), optimizer.GetMutations(), ok ? "" : " with errors");
    return ok;
}
