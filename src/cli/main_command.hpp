#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace fslogger {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;
    void printHelp() const;

protected:
    CLI::App* subcommand_ = nullptr;
};

}}
