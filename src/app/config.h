#ifndef CONFIG_H
#define CONFIG_H

#include <vector>
#include <string>

#if defined(__APPLE__)
#define FREEIMAGE_H_BOOL_OVERRIDE
#define BOOL FreeImageBOOL
#endif

#include "FreeImage.h"

#if defined(FREEIMAGE_H_BOOL_OVERRIDE)
#undef BOOL
#undef FREEIMAGE_H_BOOL_OVERRIDE
#endif
#include "CommandLineParser.h"
#include "../shape/Polygon.h"
#include "../optimization/Optimizer.h"

struct Configuration {
	std::string input_file;
	std::string output_file;
	std::string command_line;

	// population and search
	int polygons = 100;
	int vertices = 3;
	e_mutation_mode mutation_mode = E_MUTATION_SINGLE;
	unsigned long long max_evals = 0;      // 0 = unlimited
	double target_match = 0.0;             // 0 = off
	unsigned long long stagnation = 0;     // 0 = off
	unsigned long long initial_seed = 0;
	long long save_period = -1;            // -1 = auto (~30 seconds)

	// input picture
	int width = -1;                        // -1 = keep
	int height = -1;
	FREE_IMAGE_FILTER rescale_filter = FILTER_BOX;

	bool quiet = false;
	std::string font_file;                 // empty = default font next to the executable
	// CLI handling flags
	bool show_help = false;
	bool bad_arguments = false;
	std::vector<std::string> error_messages; // fatal issues to show user
	std::vector<std::string> warning_messages; // non-fatal issues

	CommandLineParser parser;

	void Process(int argc, char *argv[]);
	void ProcessTokens(const std::vector<std::string>& tokens);

	OptimizerSettings GetOptimizerSettings() const;
};

#endif
