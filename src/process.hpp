#pragma once
#include <string>
#include <vector>

namespace cronrepo {

struct ProcessResult {
    bool started = false;  // false if pipe/fork failed
    int status = 0;        // raw waitpid status
    std::string out;
    std::string err;

    bool succeeded() const;
};

// Run argv[0] from PATH, feed `input` on stdin and capture stdout/stderr.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& input = "");

} // namespace cronrepo
