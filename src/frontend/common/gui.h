#pragma once

enum GUI_command {
	STOP,
	CONTINUE,
	SAVE,
	REDRAW
};
