#pragma once

#include <string>

// Visible line prompt with the label in blue (GNU readline).
// Returns "" on end of input.
std::string styled_input(const std::string& label);

// Prompt without echoing what is typed.
std::string read_password(const std::string& label);
