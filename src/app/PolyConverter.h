#ifndef POLY_CONVERTER_H
#define POLY_CONVERTER_H

#include <chrono>
#include <memory>
#include <string>
#include "config.h"
#include "io/ImageProcessor.h"
#include "io/OutputManager.h"
#include "optimization/Optimizer.h"
#include "optimization/StatsSink.h"
#include "render/SoftwareRenderer.h"
#include "rng/RandomSource.h"
#include "FreeImage.h"

#include "frontend/console/PolyConsole.h"
#ifndef NO_GUI
#include "frontend/gui/PolySDL.h"
#endif

/**
 * Main class that coordinates the entire conversion process
 */
class PolyConverter : public StatsSink {
public:
    PolyConverter();
    ~PolyConverter();

    PolyConverter(const PolyConverter&) = delete;
    PolyConverter& operator=(const PolyConverter&) = delete;

    /**
     * Set configuration parameters
     *
     * @param config Configuration to use
     */
    void SetConfig(const Configuration& config);

    /**
     * Open the front end, load the input picture and build the optimizer
     *
     * @return True if initialization succeeded
     */
    bool ProcessInit();

    /**
     * Run rounds until the stop policy fires or the user stops
     */
    void MainLoop();

    /**
     * Save the best solution found
     *
     * @return True if all output files were written
     */
    bool SaveBestSolution();

    /**
     * Display a message in the UI
     */
    void Message(const std::string& message);

    /**
     * Display an error
     */
    void Error(const std::string& error);

    void OnRoundCompleted(const RoundStats& stats) override;

private:
    void ShowInputBitmap();
    void ShowLastCreatedPicture();
    void ShowStats();
    void UpdateRate();
    bool CheckAutoSave();
    bool UseConsole() const;
    void DisplayText(int x, int y, const std::string& text);
    GUI_command NextFrame();

public:
    // Configuration
    Configuration cfg;

    // Components
    ImageProcessor m_imageProcessor;
    SoftwareRenderer m_renderer;
    RandomSource m_rng;
    std::unique_ptr<Optimizer> m_optimizer;
    OutputManager m_outputManager;

    // UI
    PolyConsole console;
#ifndef NO_GUI
    PolySDL gui;
#endif
    bool m_gui_active;

private:
    bool m_pending_update;

    // Preview bitmaps (32 bit, top-down)
    FIBITMAP* output_bitmap;
    FIBITMAP* diff_bitmap;

    double m_rate;
    unsigned long long m_lastEval;
    unsigned long long m_lastSaveEval;
    std::chrono::steady_clock::time_point m_lastRateCheckTime;
    std::chrono::steady_clock::time_point m_lastAutoSaveTime;
};

#endif // POLY_CONVERTER_H
