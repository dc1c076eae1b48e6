#pragma once

#include <string>
#include <vector>

// Quote one argument for /bin/sh
std::string shell_quote(const std::string& arg);

// Run argv through the shell and capture stdout. *exitCode gets the
// process exit status (-1 if it could not be started).
std::string run_command_capture(const std::vector<std::string>& argv, int* exitCode = nullptr);
