#pragma once

#include <cstdarg>
#include <cstdio>
#include <ctime>

#define POLY_DEBUG_LOG_FILE "poly_debug.log"

#if defined(_DEBUG) || !defined(NDEBUG)
inline void DBG_PRINT(const char* fmt, ...)
{
	char buffer[2048];
	va_list ap;
	va_start(ap, fmt);
	std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
	va_end(ap);

	char stamp[32] = "";
	std::time_t now = std::time(nullptr);
	if (const std::tm* local = std::localtime(&now))
		std::strftime(stamp, sizeof(stamp), "%H:%M:%S", local);

	std::fprintf(stdout, "%s %s\n", stamp, buffer);
	std::fflush(stdout);
	// GUI builds may have no console attached, keep a copy on disk
	if (FILE* f = std::fopen(POLY_DEBUG_LOG_FILE, "a")) {
		std::fprintf(f, "%s %s\n", stamp, buffer);
		std::fclose(f);
	}
}
#else
inline void DBG_PRINT(const char*, ...) {}
#endif
