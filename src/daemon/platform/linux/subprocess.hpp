#pragma once

#include <expected>
#include <string>
#include <vector>

// Exit status of a finished child. 127 means exec failed (tool missing).
struct ProcessExit {
    int code = 0;
};

// Fork/exec argv[0] from PATH, feed stdin_text to its stdin and wait for it.
// Errors are failures of the calling side (pipe, fork, write, waitpid).
std::expected<ProcessExit, std::string> run_process(const std::vector<std::string>& argv,
                                                   const std::string& stdin_text = {});
