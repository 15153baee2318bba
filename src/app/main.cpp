#include "PolyConverter.h"
#include "core/debug_log.h"
#include <iostream>
#include <stdexcept>

int main(int argc, char *argv[])
{
	FreeImage_Initialise(TRUE);

	Configuration cfg;
	cfg.Process(argc, argv);
	DBG_PRINT("[MAIN] Args parsed. input='%s' polygons=%d vertices=%d quiet=%d", cfg.input_file.c_str(), cfg.polygons, cfg.vertices, (int)cfg.quiet);

	// CLI help / usage handling
	if (cfg.show_help || argc <= 1) {
		for (const auto &e : cfg.error_messages) std::cerr << "Error: " << e << "\n";
		for (const auto &w : cfg.warning_messages) std::cerr << "Warning: " << w << "\n";
		std::cout << cfg.parser.formatHelp("polyconv");
		FreeImage_DeInitialise();
		return (argc <= 1) ? 2 : 0;
	}

	if (cfg.bad_arguments || !cfg.error_messages.empty()) {
		for (const auto &e : cfg.error_messages) std::cerr << "Error: " << e << "\n";
		for (const auto &w : cfg.warning_messages) std::cerr << "Warning: " << w << "\n";
		std::cout << cfg.parser.formatHelp("polyconv");
		FreeImage_DeInitialise();
		return 2;
	}
	for (const auto &w : cfg.warning_messages) std::cerr << "Warning: " << w << "\n";

	int result = 0;
	try {
		PolyConverter poly;
		poly.SetConfig(cfg);

		DBG_PRINT("[MAIN] Calling ProcessInit() ...");
		if (poly.ProcessInit())
		{
			poly.MainLoop();
			if (!poly.SaveBestSolution())
				result = 1;
		}
		else {
			DBG_PRINT("[MAIN] ProcessInit returned false");
			result = 1;
		}
	}
	catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << std::endl;
		DBG_PRINT("[MAIN] Aborted: %s", e.what());
		result = 1;
	}

#ifndef NO_GUI
	SDL_Quit();
#endif
	FreeImage_DeInitialise();
	return result;
}
