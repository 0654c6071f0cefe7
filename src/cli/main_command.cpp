#include "main_command.hpp"

namespace subscout {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

}}
