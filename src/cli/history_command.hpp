#pragma once

#include "main_command.hpp"
#include "subscout/storage/scan_store.hpp"
#include <CLI/CLI.hpp>
#include <memory>
#include <string>

namespace subscout {
namespace cli {

class HistoryCommand : public MainCommand {
public:
    HistoryCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    std::string domain_;
    int limit_ = 0;
    bool json_output_ = false;
};

class RecentCommand : public MainCommand {
public:
    RecentCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    int limit_ = 10;
    bool json_output_ = false;
};

}}
