#include "PolyConverter.h"
#include "core/debug_log.h"
#include <ctime>
#include <iostream>
#include <memory>

PolyConverter::PolyConverter()
    : m_gui_active(false)
    , m_pending_update(false)
    , output_bitmap(nullptr)
    , diff_bitmap(nullptr)
    , m_rate(0.0)
    , m_lastEval(0)
    , m_lastSaveEval(0)
{
}

PolyConverter::~PolyConverter()
{
    if (output_bitmap)
        FreeImage_Unload(output_bitmap);
    if (diff_bitmap)
        FreeImage_Unload(diff_bitmap);
}

void PolyConverter::SetConfig(const Configuration& config)
{
    cfg = config;
}

bool PolyConverter::UseConsole() const
{
    return !m_gui_active;
}

void PolyConverter::DisplayText(int x, int y, const std::string& text)
{
#ifndef NO_GUI
    if (m_gui_active) {
        gui.DisplayText(x, y, text);
        return;
    }
#endif
    console.DisplayText(x, y, text);
}

GUI_command PolyConverter::NextFrame()
{
#ifndef NO_GUI
    if (m_gui_active)
        return gui.NextFrame();
#endif
    return console.NextFrame();
}

void PolyConverter::Message(const std::string& message)
{
    time_t t = time(NULL);
    std::string current_time = ctime(&t);
    current_time = current_time.substr(0, current_time.length() - 1);
    const int y = m_imageProcessor.GetHeight() + 170;
    DisplayText(0, y, current_time + ": " + message + std::string(UseConsole() ? 0 : 40, ' '));
}

void PolyConverter::Error(const std::string& error)
{
    DBG_PRINT("[APP] Error: %s", error.c_str());
#ifndef NO_GUI
    if (m_gui_active) {
        gui.Error(error);
        return;
    }
#endif
    console.Error(error);
}

bool PolyConverter::ProcessInit()
{
    m_imageProcessor.Initialize(cfg);
    if (!m_imageProcessor.LoadInputBitmap()) {
        Error("Error loading Input Bitmap: " + cfg.input_file);
        return false;
    }

    const int width = m_imageProcessor.GetWidth();
    const int height = m_imageProcessor.GetHeight();

#ifndef NO_GUI
    if (!cfg.quiet) {
        if (!gui.Init(cfg.command_line, width, height, cfg.font_file)) {
            Error("Cannot open the preview window. Use /quiet to run without it.");
            return false;
        }
        m_gui_active = true;
    }
#endif
    if (!m_gui_active)
        console.Init(cfg.command_line);

    m_rng.Seed(cfg.initial_seed);
    DBG_PRINT("[APP] Seed %llu", cfg.initial_seed);

    m_optimizer = std::make_unique<Optimizer>(m_imageProcessor.GetTarget(), m_renderer, m_rng, cfg.GetOptimizerSettings());
    m_optimizer->SetStatsSink(this);
    m_optimizer->Initialize();

    m_outputManager.Initialize(cfg.output_file, width, height);

    output_bitmap = FreeImage_Allocate(width, height, 32);
    diff_bitmap = FreeImage_Allocate(width, height, 32);
    if (!output_bitmap || !diff_bitmap) {
        Error("Cannot allocate preview bitmaps");
        return false;
    }

    ShowInputBitmap();
    return true;
}

void PolyConverter::OnRoundCompleted(const RoundStats& stats)
{
    if (stats.accepted)
        m_pending_update = true;
}

bool PolyConverter::SaveBestSolution()
{
    if (!m_optimizer)
        return false;
    return m_outputManager.SaveBestSolution(*m_optimizer, cfg.command_line, cfg.input_file, cfg.initial_seed);
}

void PolyConverter::UpdateRate()
{
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastRateCheckTime).count();

    // keep a window of about a second so the figure is readable
    if (elapsed >= 1000) {
        unsigned long long currentEval = m_optimizer->GetMutations();
        unsigned long long evalsDone = (currentEval >= m_lastEval) ? (currentEval - m_lastEval) : currentEval;
        m_rate = (evalsDone * 1000.0) / elapsed;
        m_lastEval = currentEval;
        m_lastRateCheckTime = now;
    }
}

bool PolyConverter::CheckAutoSave()
{
    if (cfg.save_period == -1) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - m_lastAutoSaveTime).count();

        // Auto-save every 30 seconds
        if (elapsed >= 30) {
            m_lastAutoSaveTime = now;
            return true;
        }
        return false;
    }

    unsigned long long evaluations = m_optimizer->GetMutations();
    if (evaluations - m_lastSaveEval >= (unsigned long long)cfg.save_period) {
        m_lastSaveEval = evaluations;
        return true;
    }
    return false;
}
