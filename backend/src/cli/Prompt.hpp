#pragma once
#include <string>

// Terminal prompts for the command-line front end.
std::string promptLine(const std::string& label);
std::string promptHidden(const std::string& label);   // no echo
bool confirm(const std::string& question);             // [y/N]
