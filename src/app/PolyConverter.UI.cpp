#include "PolyConverter.h"
#include "utils/string_conv.h"
#include <cstdio>

namespace {
    // RGBA buffer into a 32 bit top-down FreeImage bitmap of the same size
    void CopyToBitmap(const pixel_buffer& rgba, FIBITMAP* bitmap)
    {
        const int width = (int)FreeImage_GetWidth(bitmap);
        const int height = (int)FreeImage_GetHeight(bitmap);
        if (rgba.size() != (size_t)width * height * 4)
            return;
        for (int y = 0; y < height; ++y)
        {
            BYTE* line = FreeImage_GetScanLine(bitmap, y);
            const unsigned char* src = &rgba[(size_t)y * width * 4];
            for (int x = 0; x < width; ++x)
            {
                line[FI_RGBA_RED] = src[0];
                line[FI_RGBA_GREEN] = src[1];
                line[FI_RGBA_BLUE] = src[2];
                line[FI_RGBA_ALPHA] = 255;
                line += 4;
                src += 4;
            }
        }
    }

    // Difference overlay shown as gray over white: bright means far from the target
    void CopyDifferenceToBitmap(const pixel_buffer& overlay, FIBITMAP* bitmap)
    {
        const int width = (int)FreeImage_GetWidth(bitmap);
        const int height = (int)FreeImage_GetHeight(bitmap);
        if (overlay.size() != (size_t)width * height * 4)
            return;
        for (int y = 0; y < height; ++y)
        {
            BYTE* line = FreeImage_GetScanLine(bitmap, y);
            const unsigned char* src = &overlay[(size_t)y * width * 4];
            for (int x = 0; x < width; ++x)
            {
                const BYTE gray = (BYTE)(255 - src[3]);
                line[FI_RGBA_RED] = gray;
                line[FI_RGBA_GREEN] = gray;
                line[FI_RGBA_BLUE] = gray;
                line[FI_RGBA_ALPHA] = 255;
                line += 4;
                src += 4;
            }
        }
    }

    std::string FormatMatch(double match)
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.4f%%", match);
        return buf;
    }
}

void PolyConverter::ShowInputBitmap()
{
    if (UseConsole())
        return;
#ifndef NO_GUI
    const int height = m_imageProcessor.GetHeight();
    gui.DisplayBitmap(0, 0, m_imageProcessor.GetInputBitmap());
    gui.DisplayText(0, height + 10, "Source");
    gui.DisplayText(m_imageProcessor.GetWidth(), height + 10, "Current output");
    gui.DisplayText(m_imageProcessor.GetWidth() * 2, height + 10, "Difference");
#endif
}

void PolyConverter::ShowLastCreatedPicture()
{
    if (UseConsole() || !m_optimizer)
        return;
    const pixel_buffer& best = m_optimizer->GetBestRendering();
    if (best.empty())
        return;

    CopyToBitmap(best, output_bitmap);
    CopyDifferenceToBitmap(m_optimizer->GetBestDifferenceMap(), diff_bitmap);

#ifndef NO_GUI
    const int width = m_imageProcessor.GetWidth();
    gui.DisplayBitmap(width, 0, output_bitmap);
    gui.DisplayBitmap(width * 2, 0, diff_bitmap);
#endif
}

void PolyConverter::ShowStats()
{
    if (!m_optimizer)
        return;

    const std::string match = std::string("Match: ") + FormatMatch(m_optimizer->GetLastMatch());
    const std::string breakthroughs = std::string("Breakthroughs: ") + format_with_commas(m_optimizer->GetBreakthroughs());
    const std::string mutations = std::string("Mutations: ") + format_with_commas(m_optimizer->GetMutations());
    const std::string rate = std::string("Rate: ") + format_with_commas((unsigned long long)m_rate);

    if (UseConsole()) {
        console.DisplayText(0, 0, match + "  " + breakthroughs + "  " + mutations + "  " + rate);
        return;
    }

    const int baseY = m_imageProcessor.GetHeight() + 40;
    const int rowH = 20;
    DisplayText(0, baseY + 0, match + std::string("        "));
    DisplayText(0, baseY + rowH, breakthroughs);
    DisplayText(0, baseY + rowH * 2, mutations);
    DisplayText(0, baseY + rowH * 3, rate + std::string("                "));

    // accepted / attempted per mutation kind
    const MutationStats& stats = m_optimizer->GetMutationStats();
    const int statsX = m_imageProcessor.GetWidth() + 10;
    for (int i = 0; i < E_MUTATION_KIND_MAX; ++i) {
        DisplayText(statsX, baseY + rowH * i, std::string(mutation_kind_names[i]) + "  " +
            format_with_commas(stats.success_count[i]) + " / " + format_with_commas(stats.attempt_count[i]) + "        ");
    }
}
