#include "Difference.h"
#include "../core/Errors.h"
#include <cstdlib>
#include <string>

static void CheckSameSize(const pixel_buffer& target, const pixel_buffer& rendered)
{
	if (target.size() != rendered.size())
		throw DimensionMismatchError("Invalid data comparison: target has " + std::to_string(target.size()) +
			" bytes, rendered has " + std::to_string(rendered.size()));
}

distance_accum_t PixelDifference(const pixel_buffer& target, const pixel_buffer& rendered)
{
	CheckSameSize(target, rendered);

	const unsigned char* t = target.data();
	const unsigned char* r = rendered.data();
	const size_t n = target.size() & ~(size_t)3;
	distance_accum_t difference = 0;
	for (size_t i = 0; i < n; i += 4)
	{
		difference += std::abs((int)t[i] - (int)r[i]);
		difference += std::abs((int)t[i + 1] - (int)r[i + 1]);
		difference += std::abs((int)t[i + 2] - (int)r[i + 2]);
	}
	return difference;
}

double MatchPercentage(distance_accum_t difference, distance_accum_t maxDifference)
{
	if (maxDifference <= 0)
		throw InvalidArgumentError("MatchPercentage: maxDifference must be positive");
	return 100.0 * (1.0 - (double)difference / (double)maxDifference);
}

distance_accum_t MaxDifference(int width, int height)
{
	if (width <= 0 || height <= 0)
		throw InvalidArgumentError("MaxDifference: dimensions must be positive");
	return (distance_accum_t)width * height * MAX_PIXEL_DIFFERENCE;
}

pixel_buffer VisualizeDifference(const pixel_buffer& target, const pixel_buffer& rendered)
{
	CheckSameSize(target, rendered);

	pixel_buffer overlay(target.size(), 0);
	const size_t n = target.size() & ~(size_t)3;
	for (size_t i = 0; i < n; i += 4)
	{
		int d = std::abs((int)target[i] - (int)rendered[i])
			+ std::abs((int)target[i + 1] - (int)rendered[i + 1])
			+ std::abs((int)target[i + 2] - (int)rendered[i + 2]);
		// rounded to nearest like a clamped byte store
		overlay[i + 3] = (unsigned char)((MAX_PIXEL_DIFFERENCE - d + 1) / 3);
	}
	return overlay;
}
