#pragma once
#include <string>

namespace infrar {

// Process-level settings read from the environment; command-line flags override.
struct TransformEnv {
    std::string rulesPath;   // INFRAR_RULES; empty = built-in rule set
    unsigned jobs = 0;       // INFRAR_JOBS; 0 = hardware concurrency
    bool pruneImports = true;// INFRAR_PRUNE_IMPORTS=0 disables
    bool diagJson = false;   // INFRAR_DIAG_JSON=1 prints the JSON report to stderr
    bool debugScan = false;  // INFRAR_DEBUG_SCAN=1 traces binding and call-site decisions
    bool debugRewrite = false; // INFRAR_DEBUG_REWRITE=1 traces edits
};

TransformEnv detect_env();

// True when the variable is set to 1/t/T/y/Y.
bool env_flag_enabled(const char* name);

} // namespace infrar
