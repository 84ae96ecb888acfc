#pragma once

#include <string>

// Returns the whole contents of the file @p path; throws std::runtime_error on
// failure
std::string get_file_contents(const std::string& path);
