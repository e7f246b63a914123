#pragma once

#include "auth/AuthError.hpp"

namespace gsuite::app {

// Process exit codes of gsuite-accounts, one per error class.
enum ExitCode {
    kExitOk = 0,
    kExitUsage = 70,
    kExitConfig = 71,
    kExitStorage = 72,
    kExitPort = 73,
    kExitFlowState = 74,
    kExitProtocol = 75,
    kExitTimeout = 76,
    kExitCredential = 77,
    kExitNetwork = 78,
};

int ExitCodeFor(const gsuite::auth::AuthError& err);

class App {
public:
    App() = default;
    ~App() = default;

    int Run(int argc, char* argv[]);
};

} // namespace gsuite::app
