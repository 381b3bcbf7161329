#include <iostream>
#include <string>
#include <vector>

#include "command_line.hpp"
#include "console.hpp"

// Точка входа в программу
int main(int argc, char** argv) {
    try {
        RollOptions options = parseArguments(std::vector<std::string>(argv + 1, argv + argc));
        if (options.help) {
            printHeader();
            printUsage(std::cout);
            return 0;
        }

        dice::Roller roller;
        runRolls(options, roller, std::cout);
        return 0;
    }
    catch (const std::exception& ex) {
        printError(ex);
        return 1;
    }
}
