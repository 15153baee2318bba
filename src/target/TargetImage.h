#ifndef TARGET_IMAGE_H
#define TARGET_IMAGE_H

#include "../color/Difference.h"

// Decoded picture the population is fitted to. Rows top to bottom, RGBA bytes.
struct TargetImage {
	int width = 0;
	int height = 0;
	pixel_buffer pixels;
};

#endif
