#include "prompts.hpp"
#include "ansi.hpp"
#include <platform/terminal.hpp>
#include <core/utils.hpp>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <readline/readline.h>

std::string styled_input(const std::string& label) {
    // \001..\002 mark the escape codes as zero-width for readline's cursor math
    std::string prompt = "\001" + ansi::color::BLUE + "\002" + label
                       + "\001" + ansi::color::RESET + "\002";

    char* raw = readline(prompt.c_str());
    if (!raw) return "";

    std::string line(raw);
    std::free(raw);
    trim(line);
    return line;
}

std::string read_password(const std::string& label) {
    std::cout << ansi::blue(label);
    std::cout.flush();

    std::string password;
    {
        platform::NoEchoGuard guard;
        if (!std::getline(std::cin, password)) password.clear();
    }
    if (!platform::stdin_is_tty()) std::cout << "\n";
    return password;
}
