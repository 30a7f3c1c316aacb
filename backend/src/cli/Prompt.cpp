#include "Prompt.hpp"

#include <cctype>
#include <iostream>

#include <termios.h>
#include <unistd.h>

std::string promptLine(const std::string& label) {
    std::cout << label << ": " << std::flush;
    std::string s;
    std::getline(std::cin, s);
    return s;
}

std::string promptHidden(const std::string& label) {
    std::cout << label << ": " << std::flush;
    std::string out;

    termios oldt{};
    bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        termios newt = oldt;
        newt.c_lflag &= ~ECHO;
        ::tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }
    std::getline(std::cin, out);
    if (tty) ::tcsetattr(STDIN_FILENO, TCSANOW, &oldt);

    std::cout << "\n";
    return out;
}

bool confirm(const std::string& question) {
    std::cout << question << " [y/N]: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return !answer.empty() && std::tolower(static_cast<unsigned char>(answer[0])) == 'y';
}
