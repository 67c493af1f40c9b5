// Rule Repository: SDK signature contract plus per-(function, provider) transform rules,
// deserialized from an EDN rule source and validated before any file is processed.
#pragma once
#include "infrar/provider.hpp"
#include "infrar/source_unit.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace infrar {

struct Parameter {
    std::string name;
    std::optional<std::string> default_value; // Python expression text
};

// One SDK function of the versioned call-signature contract.
struct Signature {
    std::string module;
    std::string name;
    std::vector<Parameter> params;
    int line = -1;

    std::string qualified() const { return module + "." + name; }
    const Parameter* param(std::string_view n) const {
        for(auto& p : params) if(p.name==n) return &p;
        return nullptr;
    }
};

struct ImportRequirement {
    std::string module;
    std::string name; // empty: `import module`, else `from module import name`

    std::string statement() const { return name.empty() ? "import " + module : "from " + module + " import " + name; }
    bool satisfied_by(const ImportInfo& imp) const {
        for(auto& a : imp.names){
            if(!a.asname.empty()) continue;
            if(name.empty() ? (!imp.from && a.name==module) : (imp.from && imp.module==module && a.name==name)) return true;
        }
        return false;
    }
    bool operator==(const ImportRequirement& o) const { return module==o.module && name==o.name; }
};

// Piece of a parsed call template: literal text, or a placeholder when `placeholder` is set.
struct TemplatePart {
    std::string text;
    bool placeholder = false;
};

struct TransformRule {
    std::string function;
    Provider provider = Provider::Aws;
    std::string template_text;
    std::vector<TemplatePart> parts;
    std::vector<ImportRequirement> imports;
    std::vector<std::string> setup;              // client construction statements
    std::map<std::string, std::string> param_map; // SDK parameter -> placeholder
    bool no_capture = false;
    int line = -1;
};

// Splits "{name}" placeholders out of a template; "{{" and "}}" are literal braces.
// Throws rule_error on unbalanced braces or a non-identifier placeholder.
std::vector<TemplatePart> parse_template(std::string_view text);

class RuleRepository {
public:
    // Deserializes and validates an EDN rule source. Throws rule_error.
    static RuleRepository load(std::string_view edn_text);
    static RuleRepository load_file(const std::string& path);
    // Rule set shipped with the engine (aws, gcp and azure for infrar.storage).
    static RuleRepository builtin();

    // nullptr when no rule exists for the pair.
    const TransformRule* lookup(const std::string& function, Provider p) const;
    const Signature* signature(const std::string& function) const;
    const Signature* signature_for_qualified(const std::string& qualified) const;
    const std::vector<Signature>& signatures() const { return signatures_; }
    const std::vector<TransformRule>& rules() const { return rules_; }
    // Dotted modules that contain recognized functions ("infrar.storage").
    std::vector<std::string> modules() const;
    // Throws missing_rule_error for the first signature without a rule for p.
    void require_complete(Provider p) const;

private:
    std::vector<Signature> signatures_;
    std::vector<TransformRule> rules_;
    void validate_rule(TransformRule& r) const;
};

// EDN text of the built-in rule set.
const char* builtin_rules_edn();

} // namespace infrar
