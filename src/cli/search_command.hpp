#pragma once

#include "main_command.hpp"
#include "subscout/common/types.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace subscout {
namespace cli {

class SearchCommand : public MainCommand {
public:
    SearchCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    std::string domain_;
    bool refresh_ = false;
    bool json_output_ = false;

    void printEvent(const common::SearchEvent& event) const;
};

}}
