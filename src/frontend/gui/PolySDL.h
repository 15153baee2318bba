#pragma once

#ifndef NO_GUI

#include <SDL.h>
#include <SDL_ttf.h>
#include <string>
#include "FreeImage.h"
#include "../common/gui.h"

/**
 * Preview window: three picture panes (source, best, difference) over a text area
 */
class PolySDL {
private:
	int window_width = 320 * 3;
	int window_height = 480;

	SDL_Window* window = nullptr;
	SDL_Renderer* renderer = nullptr;
	TTF_Font* font = nullptr;
	SDL_Surface* FIBitmapToSDLSurface(FIBITMAP* fiBitmap);
public:
	~PolySDL();

	/**
	 * Open the window sized for three panes of width x height plus the text area
	 *
	 * @param font_file TTF file, empty for the default font next to the executable
	 */
	bool Init(const std::string& command_line, int width, int height, const std::string& font_file);
	void Error(const std::string& e);
	void DisplayText(int x, int y, const std::string& text);
	// Bitmap must be 32 bit and top-down
	void DisplayBitmap(int x, int y, FIBITMAP* fiBitmap);
	GUI_command NextFrame();
};

#endif // NO_GUI
