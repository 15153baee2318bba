#pragma once

#include <string>
#include "../common/gui.h"

// Headless front end: messages and statistics go to stdout, no user commands
class PolyConsole {
public:
	bool Init(const std::string& command_line);
	void Error(const std::string& e);
	void DisplayText(int x, int y, const std::string& text);
	GUI_command NextFrame();
};
