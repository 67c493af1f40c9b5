#include "infrar/rules.hpp"
#include "infrar/edn.hpp"
#include "infrar/errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace infrar {

namespace {

using edn::node;
using edn::node_ptr;

bool is_identifier(std::string_view s){
    if(s.empty() || !(std::isalpha((unsigned char)s[0]) || s[0]=='_')) return false;
    for(char c : s) if(!(std::isalnum((unsigned char)c) || c=='_')) return false;
    return true;
}

[[noreturn]] void fail(const std::string& msg, const node& at){ throw rule_error(msg, at.line, at.col); }

const edn::map& expect_map(const node& n, const char* what){
    if(auto* m = edn::as_map(n)) return *m;
    fail(std::string(what) + " must be a map", n);
}

const std::vector<node_ptr>& expect_seq(const node& n, const char* what){
    if(auto* s = edn::as_seq(n)) return *s;
    fail(std::string(what) + " must be a vector", n);
}

std::string expect_name(const node& n, const char* what){
    if(auto* s = edn::as_name(n)) return *s;
    fail(std::string(what) + " must be a string, keyword or symbol", n);
}

std::string required_name(const edn::map& m, const node& at, const char* key){
    auto v = edn::get(m, key);
    if(!v) fail(std::string("missing :") + key, at);
    return expect_name(*v, key);
}

Signature decode_signature(const node& n){
    const auto& m = expect_map(n, "signature");
    Signature sig;
    sig.line = n.line;
    sig.module = required_name(m, n, "module");
    sig.name = required_name(m, n, "name");
    if(!is_identifier(sig.name)) fail("signature name '" + sig.name + "' is not an identifier", n);
    auto params = edn::get(m, "params");
    if(!params) fail("signature '" + sig.name + "' has no :params", n);
    bool seen_default = false;
    for(auto& p : expect_seq(*params, ":params")){
        Parameter par;
        if(auto* pm = edn::as_map(*p)){
            par.name = required_name(*pm, *p, "name");
            if(auto d = edn::get(*pm, "default")){
                auto* s = edn::as_string(*d);
                if(!s) fail(":default must be a string of Python source", *d);
                par.default_value = *s;
            }
        } else {
            par.name = expect_name(*p, "parameter");
        }
        if(!is_identifier(par.name)) fail("parameter '" + par.name + "' is not an identifier", *p);
        if(sig.param(par.name)) fail("duplicate parameter '" + par.name + "' in '" + sig.name + "'", *p);
        if(par.default_value) seen_default = true;
        else if(seen_default) fail("parameter '" + par.name + "' without default follows a defaulted parameter", *p);
        sig.params.push_back(std::move(par));
    }
    return sig;
}

ImportRequirement decode_import(const node& n){
    ImportRequirement req;
    if(auto* m = edn::as_map(n)){
        req.module = required_name(*m, n, "module");
        if(auto nm = edn::get(*m, "name")) req.name = expect_name(*nm, ":name");
    } else {
        req.module = expect_name(n, "import");
    }
    if(req.module.empty()) fail("empty import module", n);
    return req;
}

TransformRule decode_rule(const node& n){
    const auto& m = expect_map(n, "rule");
    TransformRule r;
    r.line = n.line;
    r.function = required_name(m, n, "function");
    std::string prov = required_name(m, n, "provider");
    auto p = parse_provider(prov);
    if(!p) fail("unknown provider '" + prov + "'", n);
    r.provider = *p;
    auto tpl = edn::get(m, "template");
    if(!tpl || !edn::as_string(*tpl)) fail("rule '" + r.function + "' needs a :template string", n);
    r.template_text = *edn::as_string(*tpl);
    try {
        r.parts = parse_template(r.template_text);
    } catch(const rule_error& e){
        fail(std::string(e.what()) + " in template of '" + r.function + "'", *tpl);
    }
    if(auto imps = edn::get(m, "imports"))
        for(auto& i : expect_seq(*imps, ":imports")) r.imports.push_back(decode_import(*i));
    if(auto setup = edn::get(m, "setup")){
        for(auto& s : expect_seq(*setup, ":setup")){
            auto* txt = edn::as_string(*s);
            if(!txt || txt->empty()) fail(":setup entries must be non-empty strings", *s);
            if(txt->find('\n')!=std::string::npos) fail(":setup entries must be single statements", *s);
            r.setup.push_back(*txt);
        }
    }
    if(auto params = edn::get(m, "params")){
        const auto& pm = expect_map(*params, ":params");
        for(auto& kv : pm.entries) r.param_map[expect_name(*kv.first, "parameter")] = expect_name(*kv.second, "placeholder");
    }
    if(auto nc = edn::get(m, "no-capture")){
        auto* b = edn::as_bool(*nc);
        if(!b) fail(":no-capture must be true or false", *nc);
        r.no_capture = *b;
    }
    return r;
}

} // namespace

std::vector<TemplatePart> parse_template(std::string_view text){
    std::vector<TemplatePart> parts;
    std::string lit;
    for(std::size_t i=0; i<text.size(); ++i){
        char c = text[i];
        if(c=='{' && i+1<text.size() && text[i+1]=='{'){ lit += '{'; ++i; continue; }
        if(c=='}' && i+1<text.size() && text[i+1]=='}'){ lit += '}'; ++i; continue; }
        if(c=='}') throw rule_error("unmatched '}'");
        if(c!='{'){ lit += c; continue; }
        auto close = text.find('}', i+1);
        if(close==std::string_view::npos) throw rule_error("unterminated placeholder");
        std::string name(text.substr(i+1, close-i-1));
        if(!is_identifier(name)) throw rule_error("placeholder '{" + name + "}' is not an identifier");
        if(!lit.empty()){ parts.push_back(TemplatePart{lit, false}); lit.clear(); }
        parts.push_back(TemplatePart{name, true});
        i = close;
    }
    if(!lit.empty()) parts.push_back(TemplatePart{lit, false});
    return parts;
}

void RuleRepository::validate_rule(TransformRule& r) const {
    const Signature* sig = signature(r.function);
    if(!sig) throw rule_error("rule for '" + r.function + "' has no signature", r.line, 1);
    for(auto& kv : r.param_map)
        if(!sig->param(kv.first))
            throw rule_error("rule '" + r.function + "' maps unknown parameter '" + kv.first + "'", r.line, 1);
    // Unmapped parameters keep their own name as placeholder.
    for(auto& p : sig->params) r.param_map.emplace(p.name, p.name);

    std::set<std::string> placeholders;
    for(auto& part : r.parts) if(part.placeholder) placeholders.insert(part.text);
    std::set<std::string> targets;
    for(auto& kv : r.param_map){
        if(!placeholders.count(kv.second))
            throw rule_error("template of '" + r.function + "' (" + to_string(r.provider) + ") has no placeholder {" + kv.second + "} for parameter '" + kv.first + "'", r.line, 1);
        targets.insert(kv.second);
    }
    for(auto& ph : placeholders)
        if(!targets.count(ph))
            throw rule_error("placeholder {" + ph + "} in '" + r.function + "' (" + to_string(r.provider) + ") is not bound to any parameter", r.line, 1);

    for(auto& existing : rules_)
        if(existing.function==r.function && existing.provider==r.provider)
            throw rule_error("duplicate rule for '" + r.function + "' on provider '" + to_string(r.provider) + "'", r.line, 1);
}

RuleRepository RuleRepository::load(std::string_view edn_text){
    node_ptr root;
    try {
        root = edn::parse(edn_text);
    } catch(const edn::parse_error& e){
        throw rule_error(std::string("malformed rule source: ") + e.what());
    }
    const auto& top = expect_map(*root, "rule source");
    if(auto v = edn::get(top, "version")){
        if(!std::holds_alternative<int64_t>(v->data) || std::get<int64_t>(v->data)!=1)
            fail("unsupported rule source :version (expected 1)", *v);
    }
    RuleRepository repo;
    auto sigs = edn::get(top, "signatures");
    if(!sigs) fail("rule source has no :signatures", *root);
    for(auto& s : expect_seq(*sigs, ":signatures")){
        Signature sig = decode_signature(*s);
        if(repo.signature(sig.name)) fail("duplicate signature '" + sig.name + "'", *s);
        repo.signatures_.push_back(std::move(sig));
    }
    auto rules = edn::get(top, "rules");
    if(!rules) fail("rule source has no :rules", *root);
    for(auto& r : expect_seq(*rules, ":rules")){
        TransformRule rule = decode_rule(*r);
        repo.validate_rule(rule);
        repo.rules_.push_back(std::move(rule));
    }
    return repo;
}

RuleRepository RuleRepository::load_file(const std::string& path){
    std::ifstream ifs(path);
    if(!ifs) throw rule_error("cannot read rule source '" + path + "'");
    std::stringstream ss; ss << ifs.rdbuf();
    return load(ss.str());
}

RuleRepository RuleRepository::builtin(){
    return load(builtin_rules_edn());
}

const TransformRule* RuleRepository::lookup(const std::string& function, Provider p) const {
    for(auto& r : rules_) if(r.function==function && r.provider==p) return &r;
    return nullptr;
}

const Signature* RuleRepository::signature(const std::string& function) const {
    for(auto& s : signatures_) if(s.name==function) return &s;
    return nullptr;
}

const Signature* RuleRepository::signature_for_qualified(const std::string& qualified) const {
    for(auto& s : signatures_) if(s.qualified()==qualified) return &s;
    return nullptr;
}

std::vector<std::string> RuleRepository::modules() const {
    std::vector<std::string> out;
    for(auto& s : signatures_) if(std::find(out.begin(), out.end(), s.module)==out.end()) out.push_back(s.module);
    return out;
}

void RuleRepository::require_complete(Provider p) const {
    for(auto& s : signatures_) if(!lookup(s.name, p)) throw missing_rule_error(s.name, to_string(p));
}

} // namespace infrar
