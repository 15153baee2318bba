#ifndef DIFFERENCE_H
#define DIFFERENCE_H

#include <vector>

// Per-pixel worst case: three scored channels, 255 each
#define MAX_PIXEL_DIFFERENCE (255*3)

typedef long long distance_accum_t;
typedef std::vector<unsigned char> pixel_buffer; // interleaved RGBA, 4 bytes per pixel

/**
 * Sum of |dR|+|dG|+|dB| over all pixels, alpha excluded
 *
 * @throws DimensionMismatchError when the buffers differ in length
 */
distance_accum_t PixelDifference(const pixel_buffer& target, const pixel_buffer& rendered);

/**
 * 100 * (1 - difference / maxDifference). 100 means identical on scored channels.
 *
 * @throws InvalidArgumentError when maxDifference <= 0
 */
double MatchPercentage(distance_accum_t difference, distance_accum_t maxDifference);

// width * height * 3 * 255, the normalization denominator for one target image
distance_accum_t MaxDifference(int width, int height);

/**
 * Diagnostic overlay: RGB zeroed, alpha = (765 - dR - dG - dB) / 3.
 * Brighter alpha means a smaller local difference.
 *
 * @throws DimensionMismatchError when the buffers differ in length
 */
pixel_buffer VisualizeDifference(const pixel_buffer& target, const pixel_buffer& rendered);

#endif
