#include "infrar/scanner.hpp"
#include <algorithm>
#include <cstdio>

namespace infrar {

using syntax::TokenKind;

const char* to_string(CallContext c){
    switch(c){
        case CallContext::Statement: return "statement";
        case CallContext::Assigned: return "assigned";
        case CallContext::Returned: return "returned";
        case CallContext::Nested: return "nested";
    }
    return "?";
}

Scanner::Scanner(const SourceUnit& unit, const RuleRepository& rules, bool debug)
    : unit_(unit), rules_(rules), debug_(debug) {
    collect();
}

void Scanner::add(std::size_t scope, Binding b){
    if(debug_) std::fprintf(stderr, "[dbg][scan] bind %s -> %s scope=%zu line=%d%s\n", b.name.c_str(),
                            b.wildcard ? "*" : (b.target.empty() ? "<local>" : b.target.c_str()), scope, b.line,
                            b.conditional ? " conditional" : "");
    bindings_[scope].push_back(std::move(b));
}

bool Scanner::recognized_target(const std::string& dotted) const {
    return rules_.signature_for_qualified(dotted) != nullptr;
}

void Scanner::collect(){
    bindings_.assign(unit_.scopes().size(), {});
    globals_.assign(unit_.scopes().size(), {});
    for(std::size_t si=0; si<unit_.statements().size(); ++si) bind_statement(si);
}

// Names bound by an assignment-like target list in [b, e): plain names, tuple and list
// destructuring. Attribute and subscript targets bind nothing.
void Scanner::bind_targets(std::size_t scope, std::size_t si, std::size_t b, std::size_t e, bool conditional){
    const auto& toks = unit_.tokens();
    int depth = 0;
    for(std::size_t k=b; k<e; ++k){
        if(!significant(toks[k])) continue;
        if(toks[k].kind==TokenKind::Open){
            std::size_t pv = unit_.prev_significant(k);
            bool trailer = pv!=npos && pv>=b && (toks[pv].kind==TokenKind::Close || toks[pv].kind==TokenKind::String ||
                                                 (toks[pv].kind==TokenKind::Name && !syntax::is_keyword(unit_.token_text(pv))));
            if(trailer){ k = unit_.partner(k); continue; }
            ++depth; continue;
        }
        if(toks[k].kind==TokenKind::Close){ --depth; continue; }
        if(depth==0 && unit_.is_op(k, ":")) break; // annotation
        if(toks[k].kind!=TokenKind::Name || syntax::is_keyword(unit_.token_text(k))) continue;
        std::size_t pv = unit_.prev_significant(k), nx = unit_.next_significant(k);
        if(pv!=npos && pv>=b && unit_.is_op(pv, ".")) continue;
        if(nx!=npos && nx<e && (unit_.is_op(nx, ".") || toks[nx].kind==TokenKind::Open)) continue;
        add(scope, Binding{std::string(unit_.token_text(k)), "", si, toks[k].line, conditional});
    }
}

void Scanner::bind_params(std::size_t scope, std::size_t header){
    const auto& toks = unit_.tokens();
    const Statement& st = unit_.statements()[header];
    std::size_t open = npos;
    for(std::size_t k=st.first_tok; k<st.end_tok; ++k)
        if(toks[k].kind==TokenKind::Open){ open = k; break; }
    if(open==npos) return;
    std::size_t close = unit_.partner(open);
    for(std::size_t k=open+1; k<close; ++k){
        if(!significant(toks[k])) continue;
        if(toks[k].kind==TokenKind::Open){ k = unit_.partner(k); continue; }
        if(toks[k].kind!=TokenKind::Name) continue;
        std::size_t pv = unit_.prev_significant(k);
        if(pv==open || unit_.is_op(pv, ",") || unit_.is_op(pv, "*") || unit_.is_op(pv, "**"))
            add(scope, Binding{std::string(unit_.token_text(k)), "", header, toks[k].line, false});
    }
}

void Scanner::bind_statement(std::size_t si){
    const Statement& st = unit_.statements()[si];
    const auto& toks = unit_.tokens();
    const std::size_t scope = st.scope;
    const bool conditional = st.depth > unit_.scopes()[scope].body_depth;

    if(st.import){
        const ImportInfo& imp = *st.import;
        // `if c: import m` binds only when the body runs.
        const bool cond = conditional || !st.plain_import();
        if(imp.star){
            auto mods = rules_.modules();
            if(std::find(mods.begin(), mods.end(), imp.module)!=mods.end()){
                for(auto& sig : rules_.signatures())
                    if(sig.module==imp.module) add(scope, Binding{sig.name, sig.qualified(), si, st.line, cond});
            } else {
                Binding b{"*", "", si, st.line, cond};
                b.wildcard = true;
                add(scope, std::move(b));
            }
            return;
        }
        for(auto& a : imp.names)
            add(scope, Binding{bound_name(imp, a), bound_target(imp, a), si, toks[a.tok].line, cond});
        return;
    }

    std::size_t head = st.first_tok;
    if(unit_.is_name(head, "async")) head = unit_.next_significant(head);

    if(st.kind==StatementKind::Def || st.kind==StatementKind::Class){
        std::size_t nm = unit_.next_significant(head);
        if(nm<st.end_tok && toks[nm].kind==TokenKind::Name)
            add(scope, Binding{std::string(unit_.token_text(nm)), "", si, toks[nm].line, conditional});
        if(st.kind==StatementKind::Def){
            for(std::size_t s=0; s<unit_.scopes().size(); ++s)
                if(unit_.scopes()[s].header_stmt==si){ bind_params(s, si); break; }
        }
        return;
    }

    if(unit_.is_name(head, "global") || unit_.is_name(head, "nonlocal")){
        if(unit_.is_name(head, "global"))
            for(std::size_t k=head+1; k<st.end_tok; ++k)
                if(toks[k].kind==TokenKind::Name) globals_[scope].push_back(std::string(unit_.token_text(k)));
        return;
    }

    // Assignment expressions bind in the enclosing scope and may not run.
    for(std::size_t k=st.first_tok; k<st.end_tok; ++k){
        if(!unit_.is_op(k, ":=")) continue;
        std::size_t pv = unit_.prev_significant(k);
        if(pv!=npos && pv>=st.first_tok && toks[pv].kind==TokenKind::Name)
            add(scope, Binding{std::string(unit_.token_text(pv)), "", si, toks[pv].line, true});
    }

    // Compound header targets: for-loop variables and `as` names.
    if(st.body_tok!=st.first_tok){
        if(unit_.is_name(head, "for")){
            std::size_t in = head;
            while(in<st.body_tok && !unit_.is_name(in, "in")) ++in;
            bind_targets(scope, si, head+1, in, true);
        }
        if(unit_.is_name(head, "with") || unit_.is_name(head, "except")){
            for(std::size_t k=head; k<st.body_tok; ++k){
                if(!significant(toks[k])) continue;
                if(toks[k].kind==TokenKind::Open && !unit_.is_name(unit_.prev_significant(k), "as")){ k = unit_.partner(k); continue; }
                if(unit_.is_name(k, "as")){
                    std::size_t e = k+1;
                    while(e<st.body_tok && !unit_.is_op(e, ",") && !unit_.is_op(e, ":")) ++e;
                    bind_targets(scope, si, k+1, e, conditional);
                }
            }
        }
    }

    if(st.kind!=StatementKind::Assign) return;
    // Body of a one-line compound statement runs conditionally.
    const bool body_conditional = conditional || st.body_tok!=st.first_tok;
    static const char* assign_ops[] = {"=","+=","-=","*=","/=","//=","%=","**=",">>=","<<=","&=","|=","^=","@="};
    std::size_t seg = st.body_tok;
    for(std::size_t k=st.body_tok; k<st.end_tok; ++k){
        if(!significant(toks[k])) continue;
        if(toks[k].kind==TokenKind::Open){ k = unit_.partner(k); continue; }
        if(unit_.is_name(k, "lambda")) break;
        if(toks[k].kind!=TokenKind::Op) continue;
        std::string_view op = unit_.token_text(k);
        bool is_assign = false;
        for(auto a : assign_ops) if(op==a) is_assign = true;
        if(!is_assign) continue;
        bind_targets(scope, si, seg, k, body_conditional);
        if(op!="=") break;
        seg = k+1;
    }
}

std::vector<const Scanner::Binding*> Scanner::bindings_of(const std::string& name) const {
    std::vector<const Binding*> out;
    for(auto& scope : bindings_)
        for(auto& b : scope) if(!b.wildcard && b.name==name) out.push_back(&b);
    return out;
}

bool Scanner::expression_local(std::size_t si, std::size_t t, const std::string& name) const {
    const auto& toks = unit_.tokens();
    const Statement& st = unit_.statements()[si];
    auto names = [&](std::size_t b, std::size_t e){
        for(std::size_t k=b; k<e; ++k)
            if(toks[k].kind==TokenKind::Name && unit_.token_text(k)==name) return true;
        return false;
    };

    // Comprehension targets of an enclosing bracket.
    for(std::size_t o=st.first_tok; o<t; ++o){
        if(toks[o].kind!=TokenKind::Open || unit_.partner(o)<t) continue;
        const std::size_t close = unit_.partner(o);
        for(std::size_t k=o+1; k<close; ++k){
            if(toks[k].kind==TokenKind::Open){ k = unit_.partner(k); continue; }
            if(!unit_.is_name(k, "for")) continue;
            std::size_t in = k+1;
            while(in<close && !unit_.is_name(in, "in")) ++in;
            if(names(k+1, in)) return true;
        }
    }

    // Parameters of an enclosing lambda. Its body runs to the next ',' or closing bracket.
    for(std::size_t l=st.first_tok; l<t; ++l){
        if(!unit_.is_name(l, "lambda")) continue;
        std::size_t colon = l+1;
        bool param = false;
        for(; colon<st.end_tok && !unit_.is_op(colon, ":"); ++colon){
            if(toks[colon].kind==TokenKind::Open){ colon = unit_.partner(colon); continue; }
            if(toks[colon].kind!=TokenKind::Name || unit_.token_text(colon)!=name) continue;
            std::size_t pv = unit_.prev_significant(colon);
            if(pv==l || unit_.is_op(pv, ",") || unit_.is_op(pv, "*") || unit_.is_op(pv, "**")) param = true;
        }
        if(!param || colon>=t) continue;
        std::size_t stop = colon+1;
        for(; stop<st.end_tok; ++stop){
            if(toks[stop].kind==TokenKind::Open){ stop = unit_.partner(stop); continue; }
            if(toks[stop].kind==TokenKind::Close || unit_.is_op(stop, ",")) break;
        }
        if(t<stop) return true;
    }
    return false;
}

bool Scanner::bound_in(std::size_t scope, const std::string& name) const {
    for(auto& b : bindings_[scope]) if(b.name==name) return true;
    return false;
}

std::vector<const Scanner::Binding*> Scanner::live_bindings(std::size_t scope, const std::string& name, std::size_t stmt) const {
    std::vector<const Binding*> relevant;
    for(auto& b : bindings_[scope])
        if((b.name==name || b.wildcard) && b.stmt<stmt) relevant.push_back(&b);
    std::size_t from = 0;
    for(std::size_t i=relevant.size(); i-- > 0;)
        if(!relevant[i]->conditional){ from = i; break; }
    return std::vector<const Binding*>(relevant.begin()+from, relevant.end());
}

Resolution Scanner::resolve(const std::vector<std::string>& chain, std::size_t stmt) const {
    const std::string& name = chain.front();
    std::string rest;
    for(std::size_t i=1; i<chain.size(); ++i) rest += "." + chain[i];

    const auto& scopes = unit_.scopes();
    const std::size_t use_scope = unit_.statements()[stmt].scope;
    std::size_t s = use_scope;
    std::vector<const Binding*> live;
    while(s!=npos){
        const Scope& sc = scopes[s];
        if(sc.kind==ScopeKind::Module){ live = live_bindings(s, name, stmt); break; }
        if(sc.kind==ScopeKind::Function){
            if(std::find(globals_[s].begin(), globals_[s].end(), name)!=globals_[s].end()){ live = live_bindings(0, name, stmt); break; }
            // Bound anywhere in a function body means local to that function.
            if(bound_in(s, name)){ live = live_bindings(s, name, stmt); break; }
        } else if(s==use_scope && bound_in(s, name)){
            // Class bodies see their own bindings; methods skip the class scope.
            live = live_bindings(s, name, stmt);
            if(!live.empty()) break;
        }
        s = sc.parent;
    }

    if(live.empty()) return Unrecognized{};
    auto qualified_of = [&](const Binding* b)->std::string{
        return (b->wildcard || b->target.empty()) ? std::string() : b->target + rest;
    };
    std::string first = qualified_of(live.front());
    bool mixed = false, any_recognized = false;
    for(auto* b : live){
        std::string q = qualified_of(b);
        if(q!=first) mixed = true;
        if(!q.empty() && recognized_target(q)) any_recognized = true;
    }
    if(!any_recognized) return Unrecognized{};
    if(mixed){
        Ambiguous amb;
        for(auto* b : live) amb.binding_lines.push_back(b->line);
        return amb;
    }
    return Matched{first};
}

CallContext Scanner::context_of(const Statement& st, std::size_t callee_tok, std::size_t close_tok) const {
    const auto& toks = unit_.tokens();
    const std::size_t last = st.end_tok-1;
    if(callee_tok==st.body_tok && close_tok==last) return CallContext::Statement;
    if(st.kind==StatementKind::Assign){
        std::size_t op = npos;
        for(std::size_t k=st.body_tok; k<st.end_tok; ++k){
            if(!significant(toks[k])) continue;
            if(toks[k].kind==TokenKind::Open){ k = unit_.partner(k); continue; }
            if(toks[k].kind==TokenKind::Op){
                std::string_view t = unit_.token_text(k);
                if(t.size()>=1 && t.back()=='=' && t!="==" && t!="!=" && t!="<=" && t!=">=" && t!=":=") op = k;
            }
        }
        if(op!=npos && unit_.next_significant(op)==callee_tok && close_tok==last) return CallContext::Assigned;
        return CallContext::Nested;
    }
    if(unit_.is_name(st.body_tok, "return") || unit_.is_name(st.body_tok, "yield")){
        std::size_t nx = unit_.next_significant(st.body_tok);
        if(nx==callee_tok && close_tok==last) return CallContext::Returned;
    }
    return CallContext::Nested;
}

std::vector<CallArgument> Scanner::split_arguments(std::size_t open, std::size_t close) const {
    const auto& toks = unit_.tokens();
    std::vector<CallArgument> args;
    std::vector<std::size_t> seg;
    auto flush = [&]{
        if(seg.empty()) return;
        CallArgument a;
        a.line = toks[seg.front()].line;
        a.col = toks[seg.front()].col;
        std::size_t p = 0;
        if(unit_.is_op(seg[p], "**")){ a.double_star = true; ++p; }
        else if(unit_.is_op(seg[p], "*")){ a.star = true; ++p; }
        else if(seg.size()>2 && toks[seg[0]].kind==TokenKind::Name && unit_.is_op(seg[1], "=")){
            a.name = std::string(unit_.token_text(seg[0]));
            p = 2;
        }
        if(p<seg.size()){
            std::size_t b = toks[seg[p]].begin, e = toks[seg.back()].end;
            a.text = std::string(unit_.span_text(b, e));
            bool all_strings = true;
            for(std::size_t q=p; q<seg.size(); ++q) if(toks[seg[q]].kind!=TokenKind::String) all_strings = false;
            std::size_t n = seg.size()-p;
            std::string_view first = unit_.token_text(seg[p]);
            a.literal = all_strings
                || (n==1 && toks[seg[p]].kind==TokenKind::Number)
                || (n==1 && (first=="True" || first=="False" || first=="None"))
                || (n==2 && unit_.is_op(seg[p], "-") && toks[seg[p+1]].kind==TokenKind::Number);
        }
        args.push_back(std::move(a));
        seg.clear();
    };
    for(std::size_t k=open+1; k<close; ++k){
        if(!significant(toks[k])) continue;
        if(unit_.is_op(k, ",")){ flush(); continue; }
        seg.push_back(k);
        if(toks[k].kind==TokenKind::Open){
            std::size_t pk = unit_.partner(k);
            // Keep the closing bracket as the segment's last token when the group ends it.
            k = pk;
            seg.push_back(pk);
        }
    }
    flush();
    return args;
}

ScanResult Scanner::scan() const {
    ScanResult out;
    const auto& toks = unit_.tokens();
    const auto& stmts = unit_.statements();
    ErrorReporter rep{&out.skipped};
    for(std::size_t t=0; t<toks.size(); ++t){
        if(toks[t].kind!=TokenKind::Name || syntax::is_keyword(unit_.token_text(t))) continue;
        std::size_t si = unit_.statement_of(t);
        if(si==npos || stmts[si].in_import(t)) continue;
        std::size_t pv = unit_.prev_significant(t);
        if(pv!=npos && (unit_.is_op(pv, ".") || unit_.is_name(pv, "def") || unit_.is_name(pv, "class"))) continue;

        std::vector<std::string> chain{std::string(unit_.token_text(t))};
        std::size_t last = t;
        for(;;){
            std::size_t dot = unit_.next_significant(last);
            if(dot==npos || !unit_.is_op(dot, ".")) break;
            std::size_t nm = unit_.next_significant(dot);
            if(nm==npos || toks[nm].kind!=TokenKind::Name) break;
            chain.push_back(std::string(unit_.token_text(nm)));
            last = nm;
        }
        std::size_t open = unit_.next_significant(last);
        if(open==npos || toks[open].kind!=TokenKind::Open || unit_.token_text(open)!="(") continue;

        if(expression_local(si, t, chain.front())) continue;
        Resolution res = resolve(chain, si);
        if(std::holds_alternative<Unrecognized>(res)) continue;
        const std::size_t close = unit_.partner(open);
        const std::string callee(unit_.span_text(toks[t].begin, toks[last].end));

        if(auto* amb = std::get_if<Ambiguous>(&res)){
            auto d = rep.make(diag::AmbiguousBinding, "ambiguous binding for '" + callee + "'",
                              "bind the name unconditionally or call the SDK through its module", toks[t].line, toks[t].col);
            for(int ln : amb->binding_lines) d.notes.push_back(DiagNote{"'" + chain.front() + "' may be bound here", ln, -1});
            if(debug_) std::fprintf(stderr, "[dbg][scan] ambiguous %s at %d:%d\n", callee.c_str(), toks[t].line, toks[t].col);
            rep.emit(d);
            continue;
        }

        const std::string& qualified = std::get<Matched>(res).qualified;
        const Signature* sig = rules_.signature_for_qualified(qualified);
        bool comment = false;
        for(std::size_t k=open+1; k<close; ++k) if(toks[k].kind==TokenKind::Comment){ comment = true; break; }
        if(comment){
            if(debug_) std::fprintf(stderr, "[dbg][scan] skip %s at %d:%d: comment in arguments\n", callee.c_str(), toks[t].line, toks[t].col);
            rep.emit(rep.make(diag::CommentInArguments, "comment inside argument list of '" + callee + "'",
                              "move the comment outside the call's parentheses", toks[t].line, toks[t].col));
            continue;
        }

        CallSite site;
        site.qualified = qualified;
        site.function = sig->name;
        site.callee = callee;
        site.args = split_arguments(open, close);
        site.stmt = si;
        site.callee_tok = t;
        site.open_tok = open;
        site.close_tok = close;
        site.context = context_of(stmts[si], t, close);
        site.begin = toks[t].begin;
        site.end = toks[close].end;
        site.line = toks[t].line;
        site.col = toks[t].col;
        if(debug_) std::fprintf(stderr, "[dbg][scan] match %s -> %s at %d:%d (%s, %zu args)\n", callee.c_str(), qualified.c_str(),
                                site.line, site.col, to_string(site.context), site.args.size());
        out.sites.push_back(std::move(site));
    }
    return out;
}

ScanResult scan_calls(const SourceUnit& unit, const RuleRepository& rules, bool debug){
    return Scanner(unit, rules, debug).scan();
}

} // namespace infrar
