// Argument Resolver: binds a CallSite's arguments to the SDK signature.
#pragma once
#include "infrar/diagnostics.hpp"
#include "infrar/rules.hpp"
#include "infrar/scanner.hpp"
#include <map>
#include <string>

namespace infrar {

struct ResolvedValue {
    std::string text;        // literal or pass-through expression, verbatim
    bool literal = false;
    bool from_default = false;
};

struct ResolvedArguments {
    std::map<std::string, ResolvedValue> values; // keyed by SDK parameter name
};

// Either `args` is complete or `skip` explains why the site stays untouched.
struct ResolveResult {
    bool ok = false;
    ResolvedArguments args;
    Diagnostic skip;
};

ResolveResult resolve_arguments(const CallSite& site, const Signature& sig, const TransformRule& rule);

} // namespace infrar
