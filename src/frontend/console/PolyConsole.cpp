#include "PolyConsole.h"
#include <iostream>

bool PolyConsole::Init(const std::string& command_line)
{
	std::cout << "PolyConverter " << command_line << std::endl;
	return true;
}

void PolyConsole::DisplayText(int, int, const std::string& text)
{
	std::cout << text << std::endl;
}

void PolyConsole::Error(const std::string& e)
{
	std::cerr << e << std::endl;
}

GUI_command PolyConsole::NextFrame()
{
	return GUI_command::CONTINUE;
}
