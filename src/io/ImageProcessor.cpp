#include "ImageProcessor.h"
#include "../core/debug_log.h"

ImageProcessor::ImageProcessor()
    : m_input_bitmap(nullptr)
    , m_width(0)
    , m_height(0)
{
}

ImageProcessor::~ImageProcessor()
{
    if (m_input_bitmap) {
        FreeImage_Unload(m_input_bitmap);
        m_input_bitmap = nullptr;
    }
}

bool ImageProcessor::Initialize(const Configuration& config)
{
    m_config = config;
    return true;
}

void ImageProcessor::ComputeTargetSize(unsigned input_width, unsigned input_height)
{
    double iw = static_cast<double>(input_width);
    double ih = static_cast<double>(input_height);

    if (m_config.width == -1 && m_config.height == -1) {
        m_config.width = (int)input_width;
        m_config.height = (int)input_height;
    }
    else if (m_config.height == -1) // keep proportions
        m_config.height = static_cast<int>(ih * m_config.width / iw + 0.5);
    else if (m_config.width == -1)
        m_config.width = static_cast<int>(iw * m_config.height / ih + 0.5);

    if (m_config.width < 1) m_config.width = 1;
    if (m_config.height < 1) m_config.height = 1;
}

bool ImageProcessor::LoadInputBitmap()
{
    FREE_IMAGE_FORMAT format = FreeImage_GetFileType(m_config.input_file.c_str());
    if (format == FIF_UNKNOWN)
        format = FreeImage_GetFIFFromFilename(m_config.input_file.c_str());
    if (format == FIF_UNKNOWN)
        return false;

    m_input_bitmap = FreeImage_Load(format, m_config.input_file.c_str(), 0);
    if (!m_input_bitmap)
        return false;

    unsigned int input_width = FreeImage_GetWidth(m_input_bitmap);
    unsigned int input_height = FreeImage_GetHeight(m_input_bitmap);
    ComputeTargetSize(input_width, input_height);

    if ((unsigned)m_config.width != input_width || (unsigned)m_config.height != input_height)
    {
        FIBITMAP* tmp = FreeImage_Rescale(m_input_bitmap, m_config.width, m_config.height, m_config.rescale_filter);
        if (tmp) {
            FreeImage_Unload(m_input_bitmap);
            m_input_bitmap = tmp;
        }
    }
    {
        FIBITMAP* tmp = FreeImage_ConvertTo32Bits(m_input_bitmap);
        if (!tmp)
            return false;
        FreeImage_Unload(m_input_bitmap);
        m_input_bitmap = tmp;
    }

    // row 0 becomes the top row
    FreeImage_FlipVertical(m_input_bitmap);

    m_width = (int)FreeImage_GetWidth(m_input_bitmap);
    m_height = (int)FreeImage_GetHeight(m_input_bitmap);

    m_target.width = m_width;
    m_target.height = m_height;
    ExtractRGBA(m_input_bitmap, m_target.pixels);

    DBG_PRINT("[IMG] Loaded %s: %ux%u -> %dx%d", m_config.input_file.c_str(), input_width, input_height, m_width, m_height);
    return true;
}

void ImageProcessor::ExtractRGBA(FIBITMAP* bitmap, pixel_buffer& out)
{
    const int width = (int)FreeImage_GetWidth(bitmap);
    const int height = (int)FreeImage_GetHeight(bitmap);
    out.resize((size_t)width * height * 4);

    for (int y = 0; y < height; ++y)
    {
        const BYTE* line = FreeImage_GetScanLine(bitmap, y);
        unsigned char* dst = &out[(size_t)y * width * 4];
        for (int x = 0; x < width; ++x)
        {
            dst[0] = line[FI_RGBA_RED];
            dst[1] = line[FI_RGBA_GREEN];
            dst[2] = line[FI_RGBA_BLUE];
            dst[3] = line[FI_RGBA_ALPHA];
            line += 4;
            dst += 4;
        }
    }
}

FIBITMAP* ImageProcessor::CreateBitmap(const pixel_buffer& rgba, int width, int height)
{
    if (width <= 0 || height <= 0 || rgba.size() != (size_t)width * height * 4)
        return nullptr;

    FIBITMAP* bitmap = FreeImage_Allocate(width, height, 32);
    if (!bitmap)
        return nullptr;

    for (int y = 0; y < height; ++y)
    {
        BYTE* line = FreeImage_GetScanLine(bitmap, y);
        const unsigned char* src = &rgba[(size_t)y * width * 4];
        for (int x = 0; x < width; ++x)
        {
            line[FI_RGBA_RED] = src[0];
            line[FI_RGBA_GREEN] = src[1];
            line[FI_RGBA_BLUE] = src[2];
            line[FI_RGBA_ALPHA] = src[3];
            line += 4;
            src += 4;
        }
    }
    return bitmap;
}
