#include "main_command.hpp"
#include "fslogger/common/constants.hpp"
#include <iostream>

namespace fslogger {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::printHelp() const {
    std::cout << constants::system::APPLICATION_NAME << " - Concurrent filesystem inventory\n\n";
    std::cout << "Usage: fslogger [OPTIONS] COMMAND [ARGS]...\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH    Configuration file path\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version information\n\n";
    std::cout << "Commands:\n";
    std::cout << "  scan                Scan a directory tree or a single file\n\n";
    std::cout << "Examples:\n";
    std::cout << "  fslogger scan /srv/uploads\n";
    std::cout << "  fslogger scan /srv/uploads --no-recursive -b '*.tmp' -a .pdf -a .txt\n";
    std::cout << "  fslogger scan /srv/uploads --json --export\n";
}

}}
