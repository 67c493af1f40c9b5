#include "infrar/rewriter.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace infrar {

using syntax::TokenKind;

std::string instantiate(const TransformRule& rule, const ResolvedArguments& args){
    std::string out;
    for(const auto& part : rule.parts){
        if(!part.placeholder){ out += part.text; continue; }
        for(const auto& kv : rule.param_map){
            if(kv.second!=part.text) continue;
            auto it = args.values.find(kv.first);
            if(it!=args.values.end()){ out += it->second.text; break; }
        }
    }
    return out;
}

Rewriter::Rewriter(SourceUnit& unit, const RuleRepository& rules, const Scanner& scanner, RewriteOptions opts)
    : unit_(unit), rules_(rules), scanner_(scanner), opts_(opts), newline_("\n") {
    for(std::size_t i=0; i<unit_.tokens().size(); ++i){
        if(unit_.tokens()[i].kind!=TokenKind::Newline) continue;
        if(unit_.token_text(i)=="\r\n") newline_ = "\r\n";
        break;
    }
}

namespace {

bool contains(const CallSite& outer, const CallSite& inner){
    return &outer!=&inner && outer.begin<=inner.begin && inner.end<=outer.end;
}

void replace_all(std::string& s, const std::string& from, const std::string& to){
    if(from.empty()) return;
    for(std::size_t p = s.find(from); p!=std::string::npos; p = s.find(from, p + to.size())) s.replace(p, from.size(), to);
}

// Name bound by a setup statement of the form `name = value`, empty otherwise.
std::string assigned_name(const std::string& stmt){
    std::size_t i = 0;
    while(i<stmt.size() && (std::isalnum(static_cast<unsigned char>(stmt[i])) || stmt[i]=='_')) ++i;
    std::size_t eq = stmt.find_first_not_of(" \t", i);
    if(i==0 || eq==std::string::npos || stmt[eq]!='=' || stmt.compare(eq, 2, "==")==0) return "";
    return stmt.substr(0, i);
}

} // namespace

RewriteSummary Rewriter::apply(const std::vector<PlannedRewrite>& plan){
    RewriteSummary sum;
    if(plan.empty()) return sum;

    // Inner calls first so an enclosing call's arguments carry their rewritten text.
    std::vector<std::size_t> order(plan.size());
    for(std::size_t i=0; i<order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b){
        return plan[a].site->end - plan[a].site->begin < plan[b].site->end - plan[b].site->begin;
    });
    std::vector<std::string> replacement(plan.size());
    for(std::size_t i : order){
        ResolvedArguments args = plan[i].args;
        for(std::size_t j=0; j<plan.size(); ++j){
            if(!contains(*plan[i].site, *plan[j].site)) continue;
            std::string original(unit_.span_text(plan[j].site->begin, plan[j].site->end));
            for(auto& kv : args.values) replace_all(kv.second.text, original, replacement[j]);
        }
        replacement[i] = instantiate(*plan[i].rule, args);
    }

    std::vector<PlannedRewrite> in_order(plan.begin(), plan.end());
    std::sort(in_order.begin(), in_order.end(), [](const PlannedRewrite& a, const PlannedRewrite& b){ return a.site->begin < b.site->begin; });
    std::set<std::size_t> heads;
    for(const auto& p : plan) heads.insert(p.site->callee_tok);
    const NativeBlock blk = plan_block(in_order);
    const std::vector<PrunedImport> pruned = plan_prune(heads);

    if(const Scanner::Binding* live = rebound(blk, pruned)){
        if(opts_.debug) std::fprintf(stderr, "[dbg][rewrite] '%s' is still bound at line %d; %zu call(s) left unchanged\n",
                                     live->name.c_str(), live->line, in_order.size());
        for(const auto& p : in_order){
            Diagnostic d{diag::NameCollision, "native setup would rebind '" + live->name + "', which is still bound in this file",
                         "rename the existing '" + live->name + "' binding", p.site->line, p.site->col, {}};
            d.notes.push_back(DiagNote{"'" + live->name + "' is bound here", live->line, -1});
            sum.conflicts.push_back(std::move(d));
        }
        return sum;
    }

    for(std::size_t i=0; i<plan.size(); ++i){
        const CallSite& s = *plan[i].site;
        bool nested = false;
        for(std::size_t j=0; j<plan.size(); ++j) if(contains(*plan[j].site, s)) nested = true;
        if(!nested){
            if(opts_.debug) std::fprintf(stderr, "[dbg][rewrite] %d:%d %s -> %s\n", s.line, s.col, s.callee.c_str(), replacement[i].c_str());
            unit_.add_edit(Edit{s.begin, s.end, replacement[i]});
            unit_.advance(RewriteState::PartiallyRewritten);
        }
        sum.rewritten.push_back(&s);
    }
    std::sort(sum.rewritten.begin(), sum.rewritten.end(), [](const CallSite* a, const CallSite* b){ return a->begin < b->begin; });

    insert_block(blk, sum);
    if(opts_.prune_imports) prune(pruned, sum);
    unit_.advance(RewriteState::Finalized);
    return sum;
}

// Byte offset where the import/setup block goes: after the last top-level import that
// precedes the first rewritten statement, else after the docstring, else before the
// first statement.
std::size_t Rewriter::insertion_point(std::size_t first_stmt) const {
    const auto& stmts = unit_.statements();
    std::size_t top = first_stmt;
    while(top>0 && stmts[top].depth>0) --top;

    std::size_t last_import = npos;
    for(std::size_t i=0; i<top; ++i)
        if(stmts[i].depth==0 && stmts[i].plain_import()) last_import = i;
    if(last_import!=npos){
        std::size_t pos = stmts[last_import].line_end;
        return pos > stmts[top].begin ? stmts[top].line_begin : pos;
    }

    const Statement& s0 = stmts.front();
    bool docstring = s0.kind==StatementKind::Expression && &s0!=&stmts[top];
    for(std::size_t k=s0.first_tok; docstring && k<s0.end_tok; ++k)
        if(significant(unit_.tokens()[k]) && unit_.tokens()[k].kind!=TokenKind::String) docstring = false;
    return docstring ? s0.line_end : s0.line_begin;
}

Rewriter::NativeBlock Rewriter::plan_block(const std::vector<PlannedRewrite>& done) const {
    const auto& stmts = unit_.statements();
    NativeBlock blk;
    blk.pos = insertion_point(done.front().site->stmt);

    std::vector<ImportRequirement> imports;
    std::vector<std::string> setup;
    for(const auto& p : done){
        for(const auto& req : p.rule->imports)
            if(std::find(imports.begin(), imports.end(), req)==imports.end()) imports.push_back(req);
        for(const auto& s : p.rule->setup)
            if(std::find(setup.begin(), setup.end(), s)==setup.end()) setup.push_back(s);
    }

    auto present = [&](auto same){
        for(const auto& st : stmts) if(st.depth==0 && st.begin<blk.pos && same(st)) return true;
        return false;
    };
    // A copy on its own line after the insertion point moves up into the block.
    auto move_later = [&](auto same){
        for(std::size_t si=0; si<stmts.size(); ++si){
            const Statement& st = stmts[si];
            if(st.depth==0 && st.begin>=blk.pos && st.whole_line && same(st) &&
               std::find(blk.moved.begin(), blk.moved.end(), si)==blk.moved.end())
                blk.moved.push_back(si);
        }
    };

    for(const auto& req : imports){
        if(present([&](const Statement& st){ return st.plain_import() && req.satisfied_by(*st.import); })) continue;
        blk.imports.push_back(req.statement());
        std::string bound = req.name.empty() ? req.module.substr(0, req.module.find('.')) : req.name;
        std::string target = req.name.empty() ? bound : req.module + "." + req.name;
        blk.binds.emplace_back(std::move(bound), std::move(target));
        move_later([&](const Statement& st){ return st.plain_import() && st.import->names.size()==1 && req.satisfied_by(*st.import); });
    }
    for(const auto& s : setup){
        auto same = [&](const Statement& st){ return unit_.span_text(st.begin, st.end)==s; };
        if(present(same)) continue;
        blk.setup.push_back(s);
        std::string name = assigned_name(s);
        if(!name.empty()) blk.binds.emplace_back(std::move(name), "");
        move_later(same);
    }
    return blk;
}

// First binding in the file that the block would replace while code left in place may
// still read it. Import aliases whose every reference is rewritten and copies moved into
// the block do not count, nor imports of the same target.
const Scanner::Binding* Rewriter::rebound(const NativeBlock& blk, const std::vector<PrunedImport>& pruned) const {
    const auto& stmts = unit_.statements();
    auto dropped = [&](const Scanner::Binding& b){
        for(const auto& p : pruned){
            if(p.stmt!=b.stmt) continue;
            const ImportInfo& imp = *stmts[p.stmt].import;
            for(std::size_t a=0; a<imp.names.size(); ++a)
                if(p.drop[a] && bound_name(imp, imp.names[a])==b.name) return true;
        }
        return false;
    };
    for(const auto& [name, target] : blk.binds){
        for(const Scanner::Binding* b : scanner_.bindings_of(name)){
            if(std::find(blk.moved.begin(), blk.moved.end(), b->stmt)!=blk.moved.end()) continue;
            if(!target.empty() && b->target==target) continue;
            if(dropped(*b)) continue;
            return b;
        }
    }
    return nullptr;
}

void Rewriter::insert_block(const NativeBlock& blk, RewriteSummary& sum){
    for(std::size_t si : blk.moved){
        if(opts_.debug) std::fprintf(stderr, "[dbg][rewrite] move line %d into the native block\n", unit_.statements()[si].line);
        remove_statement(si);
    }
    std::string block;
    for(const auto& s : blk.imports) block += s + newline_;
    for(const auto& s : blk.setup) block += s + newline_;
    sum.inserted_imports = blk.imports;
    sum.inserted_setup = blk.setup;
    if(block.empty()) return;
    const std::string& text = unit_.text();
    if(blk.pos>0 && blk.pos==text.size() && text.back()!='\n') block = newline_ + block;
    if(opts_.debug) std::fprintf(stderr, "[dbg][rewrite] insert %zu import(s), %zu setup statement(s) at byte %zu\n",
                                 blk.imports.size(), blk.setup.size(), blk.pos);
    unit_.add_edit(Edit{blk.pos, blk.pos, block});
}

// Dotted path naming the SDK package, one of its modules or one of its functions.
bool Rewriter::sdk_target(const std::string& dotted) const {
    for(const auto& sig : rules_.signatures()){
        std::string q = sig.qualified();
        if(q==dotted || q.compare(0, dotted.size()+1, dotted + ".")==0) return true;
    }
    return false;
}

void Rewriter::remove_statement(std::size_t si){
    const auto& stmts = unit_.statements();
    const Statement& st = stmts[si];
    if(st.whole_line){ unit_.add_edit(Edit{st.line_begin, st.line_end, ""}); return; }
    if(si+1<stmts.size() && stmts[si+1].line_begin==st.line_begin){ unit_.add_edit(Edit{st.begin, stmts[si+1].begin, ""}); return; }
    if(si>0 && stmts[si-1].line_begin==st.line_begin){ unit_.add_edit(Edit{stmts[si-1].end, st.end, ""}); return; }
    unit_.add_edit(Edit{st.begin, st.end, ""});
}

std::vector<Rewriter::PrunedImport> Rewriter::plan_prune(const std::set<std::size_t>& rewritten_heads) const {
    const auto& toks = unit_.tokens();
    const auto& stmts = unit_.statements();

    // References to a bound name: every non-attribute use outside import statements.
    auto all_rewritten = [&](const std::string& name){
        std::size_t refs = 0;
        for(std::size_t k=0; k<toks.size(); ++k){
            if(toks[k].kind!=TokenKind::Name || unit_.token_text(k)!=name) continue;
            std::size_t si = unit_.statement_of(k);
            if(si!=npos && stmts[si].in_import(k)) continue;
            std::size_t pv = unit_.prev_significant(k);
            if(pv!=npos && unit_.is_op(pv, ".")) continue;
            if(!rewritten_heads.count(k)) return false;
            ++refs;
        }
        return refs>0;
    };

    std::vector<PrunedImport> out;
    for(std::size_t si=0; si<stmts.size(); ++si){
        const Statement& st = stmts[si];
        if(st.depth!=0 || !st.plain_import() || st.import->star) continue;
        const ImportInfo& imp = *st.import;
        PrunedImport p{si, std::vector<bool>(imp.names.size(), false)};
        bool any = false;
        for(std::size_t a=0; a<imp.names.size(); ++a){
            if(!sdk_target(bound_target(imp, imp.names[a]))) continue;
            if(!all_rewritten(bound_name(imp, imp.names[a]))) continue;
            p.drop[a] = any = true;
        }
        if(any) out.push_back(std::move(p));
    }
    return out;
}

void Rewriter::prune(const std::vector<PrunedImport>& pruned, RewriteSummary& sum){
    const auto& toks = unit_.tokens();
    const auto& stmts = unit_.statements();
    for(const auto& p : pruned){
        const Statement& st = stmts[p.stmt];
        const ImportInfo& imp = *st.import;
        std::size_t dropped = 0;
        for(std::size_t a=0; a<imp.names.size(); ++a){
            if(!p.drop[a]) continue;
            ++dropped;
            const auto& al = imp.names[a];
            std::string desc = (imp.from ? "from " + imp.module + " import " : std::string("import ")) + al.name + (al.asname.empty() ? "" : " as " + al.asname);
            sum.pruned_imports.push_back(desc);
            if(opts_.debug) std::fprintf(stderr, "[dbg][rewrite] prune '%s' (line %d)\n", desc.c_str(), st.line);
        }
        if(dropped==imp.names.size()){ remove_statement(p.stmt); continue; }

        // Alias spans run from the alias's first token to the token before its delimiter.
        auto alias_last = [&](std::size_t a){
            std::size_t k = imp.names[a].tok, last = k;
            for(; k<st.end_tok; ++k){
                if(!significant(toks[k])) continue;
                if(unit_.is_op(k, ",") || toks[k].kind==TokenKind::Close) break;
                last = k;
            }
            return last;
        };
        std::size_t last_kept = 0;
        for(std::size_t a=0; a<imp.names.size(); ++a) if(!p.drop[a]) last_kept = a;
        for(std::size_t a=0; a<last_kept; ++a)
            if(p.drop[a]) unit_.add_edit(Edit{toks[imp.names[a].tok].begin, toks[imp.names[a+1].tok].begin, ""});
        if(last_kept+1<imp.names.size())
            unit_.add_edit(Edit{toks[alias_last(last_kept)].end, toks[alias_last(imp.names.size()-1)].end, ""});
    }
}

} // namespace infrar
