#pragma once

#include <string>

// Read a whole file. Returns false (with a reason in *error) on failure.
bool read_file(const std::string& path, std::string& content, std::string* error = nullptr);

bool file_exists(const std::string& path);

// Permission bits of an existing file, or -1
int file_mode(const std::string& path);
