#pragma once

#include <string>
#include <vector>

namespace asmhom {

struct ProcessResult {
    int exit_code = -1;       // 128 + signal number if killed by a signal
    std::string stdout_text;
    std::string stderr_text;
};

// Run argv[0] (searched in PATH) with argv, waiting for it to finish.
// stdout and stderr are redirected to uniquely named files under work_dir
// and read back once the process exits; the files are then deleted.
// Returns false and sets error_msg if the process could not be started
// (including the executable not being found). A non-zero exit status is
// not a failure of run_process itself.
bool run_process(const std::vector<std::string>& argv,
                 const std::string& work_dir,
                 ProcessResult& result,
                 std::string& error_msg);

// Join argv for log messages.
std::string format_command(const std::vector<std::string>& argv);

} // namespace asmhom
