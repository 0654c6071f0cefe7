#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace subscout {
namespace cli {

class ProbeCommand : public MainCommand {
public:
    ProbeCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    std::string host_;
    bool json_output_ = false;
};

}}
