#pragma once

#include <string>
#include <vector>

namespace subscout {
namespace common {

struct ProcessResult {
    bool spawned = false;
    int spawn_errno = 0;
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
};

// Runs argv[0] (looked up on PATH), feeds `input` on stdin and collects both
// output streams until the child exits. A failed exec is reported through
// spawned=false and spawn_errno rather than as an exit code.
ProcessResult runProcess(const std::vector<std::string>& argv, const std::string& input);

}}
