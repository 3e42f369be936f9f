#include <iostream>
#include <string>
#include <vector>
#include "cli.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        Cli::Options options = Cli::parseCommandLine(args);
        Log::setVerbose(options.verbose);
        return Cli::run(options, std::cout, std::cerr);
    } catch (const Cli::UsageError& e) {
        std::cerr << "error: " << e.message << "\n\n" << Cli::usage();
        return Cli::EXIT_USAGE;
    } catch (const CompilerError& e) {
        std::cerr << e.what() << std::endl;
        return Cli::EXIT_ERRORS;
    } catch (const std::exception& e) {
        std::cerr << "Standard exception: " << e.what() << std::endl;
        return Cli::EXIT_ERRORS;
    }
}
