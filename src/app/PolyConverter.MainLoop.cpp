#include "PolyConverter.h"
#include "core/debug_log.h"
#include <chrono>

void PolyConverter::MainLoop()
{
    Message("Optimization started.");

    const auto ui_period = std::chrono::milliseconds(UseConsole() ? 1000 : 16);
    const auto start = std::chrono::steady_clock::now();
    m_lastRateCheckTime = start;
    m_lastAutoSaveTime = start;
    auto last_ui = start;

    bool running = true;
    while (running && !m_optimizer->IsFinished())
    {
        m_optimizer->RunRound();

        auto now = std::chrono::steady_clock::now();
        if (now - last_ui < ui_period && !m_optimizer->IsFinished())
            continue;
        last_ui = now;

        UpdateRate();

        if (CheckAutoSave()) {
            SaveBestSolution();
            Message("Auto-saved.");
        }

        if (m_pending_update)
        {
            m_pending_update = false;
            ShowLastCreatedPicture();
        }
        ShowStats();

        switch (NextFrame())
        {
        case GUI_command::SAVE:
            SaveBestSolution();
            Message("Saved.");
            break;
        case GUI_command::STOP:
            DBG_PRINT("[APP] STOP command received from GUI");
            running = false;
            break;
        case GUI_command::REDRAW:
            ShowInputBitmap();
            ShowLastCreatedPicture();
            ShowStats();
            break;
        default:
            break;
        }
    }

    m_optimizer->Stop();

    ShowLastCreatedPicture();
    ShowStats();
    Message("Finished: " + m_optimizer->GetFinishReason());
}
