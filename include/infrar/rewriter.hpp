// Rewriter: turns resolved call sites into edits on a SourceUnit, then adds the
// native import/setup block once and prunes SDK imports left without references.
#pragma once
#include "infrar/resolver.hpp"
#include "infrar/rules.hpp"
#include "infrar/scanner.hpp"
#include "infrar/source_unit.hpp"
#include <set>
#include <string>
#include <vector>

namespace infrar {

// A call site whose rule and arguments are known.
struct PlannedRewrite {
    const CallSite* site;
    const TransformRule* rule;
    ResolvedArguments args;
};

struct RewriteOptions {
    bool prune_imports = true;
    bool debug = false;
};

struct RewriteSummary {
    std::vector<const CallSite*> rewritten;   // source order
    std::vector<std::string> inserted_imports;
    std::vector<std::string> inserted_setup;
    std::vector<std::string> pruned_imports;
    // One per planned site when the native block would rebind a name user code still binds.
    std::vector<Diagnostic> conflicts;
};

// Fills a rule's template. Parameters map to placeholders through the rule's param_map.
std::string instantiate(const TransformRule& rule, const ResolvedArguments& args);

class Rewriter {
public:
    // `scanner` must have been built over `unit`.
    Rewriter(SourceUnit& unit, const RuleRepository& rules, const Scanner& scanner, RewriteOptions opts = {});

    // Records every edit for the plan and finalizes the unit. With an empty plan, or
    // when the native block would rebind a live name, the unit stays Unmodified.
    RewriteSummary apply(const std::vector<PlannedRewrite>& plan);

private:
    // Native imports and setup for the file, not yet recorded as edits.
    struct NativeBlock {
        std::size_t pos = 0;
        std::vector<std::string> imports;
        std::vector<std::string> setup;
        std::vector<std::pair<std::string, std::string>> binds; // name, import target (empty for setup)
        std::vector<std::size_t> moved; // later top-level copies folded into the block
    };
    struct PrunedImport {
        std::size_t stmt;
        std::vector<bool> drop; // per alias
    };

    SourceUnit& unit_;
    const RuleRepository& rules_;
    const Scanner& scanner_;
    RewriteOptions opts_;
    std::string newline_;

    std::size_t insertion_point(std::size_t first_stmt) const;
    NativeBlock plan_block(const std::vector<PlannedRewrite>& done) const;
    std::vector<PrunedImport> plan_prune(const std::set<std::size_t>& rewritten_heads) const;
    const Scanner::Binding* rebound(const NativeBlock& blk, const std::vector<PrunedImport>& pruned) const;
    void insert_block(const NativeBlock& blk, RewriteSummary& sum);
    void prune(const std::vector<PrunedImport>& pruned, RewriteSummary& sum);
    bool sdk_target(const std::string& dotted) const;
    void remove_statement(std::size_t si);
};

} // namespace infrar
