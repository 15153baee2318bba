#ifndef OUTPUT_MANAGER_H
#define OUTPUT_MANAGER_H

#include <string>
#include <vector>
#include "FreeImage.h"
#include "../shape/Polygon.h"
#include "../color/Difference.h"

class Optimizer;

/**
 * Manages all file output operations
 */
class OutputManager {
public:
    OutputManager();

    /**
     * Initialize the output manager
     *
     * @param outputFile Base name for output files (e.g. "out.png")
     * @param width Image width
     * @param height Image height
     */
    void Initialize(const std::string& outputFile, int width, int height);

    /**
     * Save a top-down bitmap as PNG
     *
     * @param filename Filename to save to
     * @param bitmap Bitmap to save, left untouched
     * @return True if saving was successful
     */
    bool SavePicture(const std::string& filename, FIBITMAP* bitmap);

    /**
     * Save an RGBA buffer of the configured size as PNG
     */
    bool SavePicture(const std::string& filename, const pixel_buffer& rgba);

    /**
     * Save the population as SVG polygons in draw order over a white background
     */
    bool SaveSvg(const std::string& filename, const std::vector<Polygon>& polygons);

    /**
     * Save the population as plain text.
     * Header lines start with ';', then one line per polygon: "r g b a x0 y0 x1 y1 ..."
     * The header carries the resolved seed so that "/seed=random" runs can be repeated.
     */
    bool SavePolygons(const std::string& filename,
                      const std::vector<Polygon>& polygons,
                      const std::string& cmdLine,
                      const std::string& inputFile,
                      unsigned long long seed,
                      unsigned long long rounds,
                      unsigned long long breakthroughs,
                      double match);

    /**
     * Save the best solution (all files)
     *
     * @return True if every file was written
     */
    bool SaveBestSolution(const Optimizer& optimizer,
                          const std::string& cmdLine,
                          const std::string& inputFile,
                          unsigned long long seed);

    /**
     * "out.png" -> "out" + suffix, other names get the suffix appended
     */
    std::string DeriveFileName(const std::string& suffix) const;

private:
    std::string m_outputFile;
    int m_width;
    int m_height;
};

#endif // OUTPUT_MANAGER_H
