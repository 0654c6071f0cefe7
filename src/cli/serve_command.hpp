#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <atomic>
#include <string>

namespace subscout {
namespace cli {

class ServeCommand : public MainCommand {
public:
    ServeCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    std::string host_;
    int port_ = -1;
    bool check_config_ = false;

    static std::atomic<bool> stop_requested_;
    static void signalHandlerStatic(int signal);
};

}}
