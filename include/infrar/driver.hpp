// Transformation Driver: scan, look up rules, resolve, rewrite and emit one file, or a
// batch of files on worker threads.
#pragma once
#include "infrar/diagnostics.hpp"
#include "infrar/env.hpp"
#include "infrar/provider.hpp"
#include "infrar/rules.hpp"
#include "infrar/scanner.hpp"
#include "infrar/source_unit.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace infrar {

struct TransformOptions {
    bool prune_imports = true;
    bool debug_scan = false;
    bool debug_rewrite = false;

    static TransformOptions from_env(const TransformEnv& env){
        TransformOptions o;
        o.prune_imports = env.pruneImports;
        o.debug_scan = env.debugScan;
        o.debug_rewrite = env.debugRewrite;
        return o;
    }
};

struct TransformResult {
    std::string output;
    RewriteState state = RewriteState::Unmodified;
    std::vector<CallSite> transformed;     // source order
    std::vector<Diagnostic> skipped;       // sorted by position
    std::vector<std::string> inserted_imports;
    std::vector<std::string> inserted_setup;
    std::vector<std::string> pruned_imports;

    bool changed() const { return state!=RewriteState::Unmodified; }
};

// Transforms one source text for a provider. Per-site problems land in `skipped`.
// Throws parse_error for malformed text and missing_rule_error when a recognized
// function has no rule for the provider.
TransformResult transform(std::string_view source, Provider provider, const RuleRepository& rules,
                          const TransformOptions& opts = {}, const std::string& name = "<memory>");

struct FileJob {
    std::string input;
    std::string output; // empty: do not write
};

struct FileReport {
    std::string path;
    std::string output_path;
    bool ok = false;
    TransformResult result;
    std::optional<Diagnostic> error; // parse or IO failure
};

// Runs every job on `jobs` worker threads (0 = hardware concurrency). File failures are
// recorded in their report; a missing_rule_error stops the batch and is rethrown.
std::vector<FileReport> transform_files(const std::vector<FileJob>& files, Provider provider, const RuleRepository& rules,
                                        const TransformOptions& opts = {}, unsigned jobs = 0);

} // namespace infrar
