#pragma once

#include <string>
#include <vector>

namespace iman {

struct ProcessOutput {
    std::string stdoutText;
    int exitCode{-1};      // -1 when the child died from a signal
};

// Run argv[0] (PATH lookup applies) and wait for it, capturing stdout.
// Returns false only when the program could not be started or had to be
// killed after timeoutSec; a non-zero exit status is reported via out.exitCode.
bool runCapture(const std::vector<std::string>& argv, int timeoutSec, ProcessOutput& out, std::string& err);

// Start argv[0] fully detached (own session, reparented to init) and return
// without waiting. Exec failures in the child are reported back through a
// close-on-exec pipe.
bool spawnDetached(const std::vector<std::string>& argv, const std::string& workDir, std::string& err);

} // namespace iman
