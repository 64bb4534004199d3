#pragma once
/*
 * Logging
 *
 * Purpose: install the process-wide spdlog logger ("mgram").
 * Note: the screen belongs to ncurses, so output goes to a file; when the
 * file cannot be opened a null sink is installed instead.
 */
#include <filesystem>
#include <string>

// Returns false (with msg) when the file sink failed and logging is off.
bool init_logging(const std::filesystem::path& file, const std::string& level, std::string& msg);
