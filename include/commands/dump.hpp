#pragma once
#include <string>

// Prints a resume JSON file section by section.
int cmd_dump(const std::string& resume_path);
