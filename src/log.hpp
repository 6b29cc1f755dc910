#pragma once
/*
 * Logging
 *
 * Purpose: install the process-wide spdlog logger.
 * Note: ncurses owns the terminal, so records go to Settings::log_file or nowhere.
 */
#include <string>
#include "settings.hpp"

// falls back to a null logger and returns false with msg when log_file cannot be opened
bool init_logging(const Settings& settings, std::string& msg);
