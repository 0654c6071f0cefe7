#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace subscout {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

protected:
    CLI::App* subcommand_ = nullptr;
};

}}
