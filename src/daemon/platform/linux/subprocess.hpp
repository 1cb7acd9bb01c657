#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Runs argv[0] from PATH with stdout/stderr captured. The child is killed
// when it outlives the timeout, which is reported as an error.
std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);
