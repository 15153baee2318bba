#ifndef IMAGE_PROCESSOR_H
#define IMAGE_PROCESSOR_H

#include <string>
#include "FreeImage.h"
#include "../color/Difference.h"
#include "../target/TargetImage.h"
#include "config.h"

/**
 * Loads the input picture and turns it into the optimizer's target
 */
class ImageProcessor {
public:
    ImageProcessor();
    ~ImageProcessor();

    ImageProcessor(const ImageProcessor&) = delete;
    ImageProcessor& operator=(const ImageProcessor&) = delete;

    /**
     * Initialize the processor with configuration
     *
     * @param config Configuration parameters
     * @return True if initialization succeeded
     */
    bool Initialize(const Configuration& config);

    /**
     * Load, rescale and convert the input bitmap.
     * Fills the target image on success.
     *
     * @return True if loading succeeded
     */
    bool LoadInputBitmap();

    const TargetImage& GetTarget() const { return m_target; }

    // 32 bit, top-down (flipped after load); owned by the processor
    FIBITMAP* GetInputBitmap() const { return m_input_bitmap; }

    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }

    /**
     * Copy the top-down FreeImage bitmap scanlines into an RGBA buffer
     */
    static void ExtractRGBA(FIBITMAP* bitmap, pixel_buffer& out);

    /**
     * Create a 32 bit top-down FreeImage bitmap from an RGBA buffer.
     * Caller unloads the result.
     *
     * @return Bitmap or nullptr when FreeImage cannot allocate it
     */
    static FIBITMAP* CreateBitmap(const pixel_buffer& rgba, int width, int height);

private:
    void ComputeTargetSize(unsigned input_width, unsigned input_height);

private:
    Configuration m_config;
    FIBITMAP* m_input_bitmap;
    TargetImage m_target;
    int m_width;
    int m_height;
};

#endif // IMAGE_PROCESSOR_H
