// Call-Site Scanner: finds calls to recognized SDK functions in a SourceUnit using
// static binding analysis over imports, assignments and definitions.
#pragma once
#include "infrar/diagnostics.hpp"
#include "infrar/rules.hpp"
#include "infrar/source_unit.hpp"
#include <string>
#include <variant>
#include <vector>

namespace infrar {

struct CallArgument {
    std::string name;        // keyword name, empty for positional
    std::string text;        // verbatim expression source
    bool literal = false;    // string, number, True, False or None
    bool star = false;       // *args
    bool double_star = false;// **kwargs
    int line = 0;
    int col = 0;
};

// How the call's value is used by its statement.
enum class CallContext {
    Statement, // the call is the whole expression statement
    Assigned,  // right-hand side of an assignment
    Returned,  // operand of return / yield
    Nested     // inside a larger expression
};
const char* to_string(CallContext c);

struct CallSite {
    std::string qualified;   // "infrar.storage.upload"
    std::string function;    // "upload"
    std::string callee;      // text as written, e.g. "storage.upload"
    std::vector<CallArgument> args;
    CallContext context = CallContext::Statement;
    std::size_t stmt = npos;      // index into SourceUnit::statements()
    std::size_t callee_tok = npos;// first token of the callee chain
    std::size_t open_tok = npos;
    std::size_t close_tok = npos;
    std::size_t begin = 0;        // byte span from callee to ')'
    std::size_t end = 0;
    int line = 0;
    int col = 0;
};

// Outcome of resolving a callee name against the bindings in scope.
struct Matched { std::string qualified; };
struct Unrecognized {};
struct Ambiguous { std::vector<int> binding_lines; };
using Resolution = std::variant<Matched, Unrecognized, Ambiguous>;

struct ScanResult {
    std::vector<CallSite> sites;      // recognized calls in source order
    std::vector<Diagnostic> skipped;  // recognized calls that cannot be rewritten at all
};

class Scanner {
public:
    Scanner(const SourceUnit& unit, const RuleRepository& rules, bool debug = false);

    ScanResult scan() const;

    struct Binding {
        std::string name;
        std::string target;   // dotted path for imports; empty for anything else
        std::size_t stmt;
        int line;
        bool conditional;     // inside an if/try/for/while/with block of its scope
        bool wildcard = false;// `from m import *` of a module without recognized functions
    };

    // Resolves the dotted chain `head(.attr)*` written in statement `stmt`.
    Resolution resolve(const std::vector<std::string>& chain, std::size_t stmt) const;
    // Every binding of `name` in any scope, in statement order per scope.
    std::vector<const Binding*> bindings_of(const std::string& name) const;

private:
    const SourceUnit& unit_;
    const RuleRepository& rules_;
    bool debug_;
    std::vector<std::vector<Binding>> bindings_; // per scope
    std::vector<std::vector<std::string>> globals_; // names declared global per scope

    void collect();
    void bind_statement(std::size_t si);
    void add(std::size_t scope, Binding b);
    void bind_targets(std::size_t scope, std::size_t si, std::size_t b, std::size_t e, bool conditional);
    void bind_params(std::size_t scope, std::size_t header);
    bool recognized_target(const std::string& dotted) const;
    bool bound_in(std::size_t scope, const std::string& name) const;
    // Comprehension target or lambda parameter visible at token `t` of statement `si`.
    bool expression_local(std::size_t si, std::size_t t, const std::string& name) const;
    // Bindings that may be live for `name` at statement `stmt`: the latest unconditional one
    // and every conditional binding after it.
    std::vector<const Binding*> live_bindings(std::size_t scope, const std::string& name, std::size_t stmt) const;
    CallContext context_of(const Statement& st, std::size_t callee_tok, std::size_t close_tok) const;
    std::vector<CallArgument> split_arguments(std::size_t open, std::size_t close) const;
};

// Convenience wrapper.
ScanResult scan_calls(const SourceUnit& unit, const RuleRepository& rules, bool debug = false);

} // namespace infrar
