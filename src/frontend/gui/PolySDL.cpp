#ifndef NO_GUI
#include "PolySDL.h"
#include "../../core/debug_log.h"
#include <algorithm>
#include <iostream>

using namespace std;

#define POLY_DEFAULT_FONT "poly_font.ttf"

PolySDL::~PolySDL()
{
	if (font)
		TTF_CloseFont(font);
	if (renderer)
		SDL_DestroyRenderer(renderer);
	if (window)
		SDL_DestroyWindow(window);
	if (TTF_WasInit())
		TTF_Quit();
}

bool PolySDL::Init(const std::string& command_line, int width, int height, const std::string& font_file)
{
	DBG_PRINT("[SDL] Init start. cmdline='%s'", command_line.c_str());
	if (SDL_Init(SDL_INIT_VIDEO) != 0) {
		std::cerr << "SDL_Init: " << SDL_GetError() << std::endl;
		DBG_PRINT("[SDL] SDL_Init failed: %s", SDL_GetError());
		return false;
	}

	// three panes and room for the statistics below
	window_width = std::max(width * 3, 640);
	window_height = height + 200;

	std::string title = "Poly Converter " + command_line;
	window = SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, window_width, window_height, SDL_WINDOW_RESIZABLE | SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI);
	if (!window) {
		DBG_PRINT("[SDL] SDL_CreateWindow failed: %s", SDL_GetError());
		return false;
	}
	renderer = SDL_CreateRenderer(window, -1, 0);
	if (!renderer) {
		DBG_PRINT("[SDL] SDL_CreateRenderer failed: %s", SDL_GetError());
		return false;
	}

	SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "nearest");
	SDL_RenderSetLogicalSize(renderer, window_width, window_height);
	SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
	SDL_RenderClear(renderer);

	// load font
	if (TTF_Init() != 0) {
		DBG_PRINT("[SDL] TTF_Init failed: %s", TTF_GetError());
		return false;
	}
	string font_path = font_file;
	if (font_path.empty()) {
		char* base = SDL_GetBasePath();
		if (base) {
			font_path = base;
			SDL_free(base);
		}
		font_path += POLY_DEFAULT_FONT;
	}

	font = TTF_OpenFont(font_path.c_str(), 16);
	DBG_PRINT("[SDL] TTF path '%s' -> font=%p", font_path.c_str(), (void*)font);
	if (!font) {
		string error_text = string("TTF_OpenFont: ") + TTF_GetError();
		std::cerr << "SDL_Init: Cannot load font " << font_path << std::endl;
		std::cerr << error_text << std::endl;
		SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "Error", error_text.c_str(), NULL);
		return false;
	}

	DBG_PRINT("[SDL] Init success");
	return true;
}

void PolySDL::DisplayText(int x, int y, const std::string& text)
{
	static SDL_Color textColor = { 255, 255, 255, 255 };
	static SDL_Color backgroundColor = { 0, 0, 0, 255 };

	if (!font || !renderer) { DBG_PRINT("[SDL] DisplayText called before Init"); return; }
	SDL_Surface* textSurface = TTF_RenderText_Shaded(font, text.c_str(), textColor, backgroundColor);
	if (textSurface == nullptr)
	{
		SDL_Log("Unable to create text surface: %s\n", TTF_GetError());
		return;
	}

	SDL_Texture* textTexture = SDL_CreateTextureFromSurface(renderer, textSurface);
	if (textTexture == nullptr)
	{
		SDL_Log("Unable to create text texture: %s\n", SDL_GetError());
		SDL_FreeSurface(textSurface);
		return;
	}

	SDL_Rect textRect = { x, y, textSurface->w, textSurface->h };
	SDL_RenderCopy(renderer, textTexture, NULL, &textRect);

	SDL_DestroyTexture(textTexture);
	SDL_FreeSurface(textSurface);
}

void PolySDL::Error(const std::string& e)
{
	SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "Error", e.c_str(), window);
}

SDL_Surface* PolySDL::FIBitmapToSDLSurface(FIBITMAP* fiBitmap)
{
	int width = FreeImage_GetWidth(fiBitmap);
	int height = FreeImage_GetHeight(fiBitmap);
	int pitch = FreeImage_GetPitch(fiBitmap);

	// 32-bit FreeImage bitmaps are BGRA in memory on little endian hosts
	return SDL_CreateRGBSurfaceWithFormatFrom(
		FreeImage_GetBits(fiBitmap), width, height, 32, pitch, SDL_PIXELFORMAT_BGRA32
	);
}

void PolySDL::DisplayBitmap(int x, int y, FIBITMAP* fiBitmap)
{
	if (!renderer || !fiBitmap)
		return;
	SDL_Surface* surface = FIBitmapToSDLSurface(fiBitmap);
	if (!surface) {
		SDL_Log("Unable to create bitmap surface: %s\n", SDL_GetError());
		return;
	}
	SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
	if (!texture) {
		SDL_Log("Unable to create bitmap texture: %s\n", SDL_GetError());
		SDL_FreeSurface(surface);
		return;
	}

	SDL_Rect destRect = { x, y, surface->w, surface->h };
	SDL_RenderCopy(renderer, texture, NULL, &destRect);

	SDL_DestroyTexture(texture);
	SDL_FreeSurface(surface);
}

GUI_command PolySDL::NextFrame()
{
	SDL_Event e;

	while (SDL_PollEvent(&e) > 0)
	{
		switch (e.type)
		{
		case SDL_QUIT:
			return GUI_command::STOP;
		case SDL_KEYDOWN:
			if (e.key.repeat == 0)
			{
				switch (e.key.keysym.sym)
				{
				case SDLK_s:
					return GUI_command::SAVE;
				case SDLK_ESCAPE:
				{
					const SDL_MessageBoxButtonData buttons[] = {
						{ /* .flags, .buttonid, .text */        0, 0, "No" },
						{ SDL_MESSAGEBOX_BUTTON_RETURNKEY_DEFAULT, 1, "Yes" },
					};
					const SDL_MessageBoxData messageboxdata = {
						SDL_MESSAGEBOX_INFORMATION, /* .flags */
						window, /* .window */
						"Poly Converter", /* .title */
						"Do you really want to quit?", /* .message */
						SDL_arraysize(buttons), /* .numbuttons */
						buttons, /* .buttons */
						NULL /* .colorScheme */
					};
					int buttonid;
					if (SDL_ShowMessageBox(&messageboxdata, &buttonid) < 0) {
						SDL_Log("error displaying message box");
						return GUI_command::STOP;
					}
					if (buttonid == 1)
						return GUI_command::STOP;
					return GUI_command::CONTINUE;
				}
				default:
					break;
				}
			}
			break;
		case SDL_WINDOWEVENT:
			if (e.window.event == SDL_WINDOWEVENT_RESIZED || e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED || e.window.event == SDL_WINDOWEVENT_EXPOSED) {
				SDL_RenderSetViewport(renderer, NULL);
				SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
				SDL_RenderClear(renderer);
				return GUI_command::REDRAW;
			}
			break;
		}
	}
	if (renderer)
		SDL_RenderPresent(renderer);
	return GUI_command::CONTINUE;
}

#endif
