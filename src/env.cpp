#include "infrar/env.hpp"
#include <cstdlib>
#include <string>

namespace infrar {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}

TransformEnv detect_env(){
    TransformEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("INFRAR_RULES")) e.rulesPath = v;

    if (const char* v = get("INFRAR_JOBS")) {
        char* end = nullptr; unsigned long n = std::strtoul(v, &end, 10);
        if (end && *end == '\0') e.jobs = (unsigned)n;
    }

    if (const char* v = get("INFRAR_PRUNE_IMPORTS")) e.pruneImports = !(v[0]=='0' || v[0]=='n' || v[0]=='N' || v[0]=='f' || v[0]=='F');

    e.diagJson = env_flag_enabled("INFRAR_DIAG_JSON");
    e.debugScan = env_flag_enabled("INFRAR_DEBUG_SCAN");
    e.debugRewrite = env_flag_enabled("INFRAR_DEBUG_REWRITE");
    return e;
}

} // namespace infrar
