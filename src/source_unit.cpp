#include "infrar/source_unit.hpp"
#include "infrar/errors.hpp"
#include <stdexcept>
#include <utility>

namespace infrar {

using syntax::Token;
using syntax::TokenKind;

const char* to_string(RewriteState s){
    switch(s){
        case RewriteState::Unmodified: return "unmodified";
        case RewriteState::PartiallyRewritten: return "partially-rewritten";
        case RewriteState::Finalized: return "finalized";
    }
    return "?";
}

SourceUnit::SourceUnit(std::string text, std::string name) : text_(std::move(text)), name_(std::move(name)) {
    build();
}

std::size_t SourceUnit::next_significant(std::size_t tok) const {
    for(std::size_t i=tok+1; i<tokens_.size(); ++i) if(significant(tokens_[i])) return i;
    return npos;
}

std::size_t SourceUnit::prev_significant(std::size_t tok) const {
    for(std::size_t i=tok; i-- > 0;) if(significant(tokens_[i])) return i;
    return npos;
}

// Column width of the physical line's leading whitespace; tabs advance to multiples of 8.
int SourceUnit::indent_width(std::size_t tok) const {
    std::size_t b = tokens_[tok].begin;
    std::size_t ls = b==0 ? npos : text_.rfind('\n', b-1);
    ls = ls==npos ? 0 : ls+1;
    int w = 0;
    for(std::size_t i=ls; i<b; ++i){
        char c = text_[i];
        if(c==' ') ++w;
        else if(c=='\t') w = (w/8+1)*8;
        else if(c=='\f') w = 0;
    }
    return w;
}

void SourceUnit::build(){
    tokens_ = syntax::tokenize(text_, name_);
    const std::size_t n = tokens_.size();
    partner_.assign(n, npos);
    stmt_of_.assign(n, npos);
    scopes_.push_back(Scope{ScopeKind::Module, "", npos, npos, 0});

    std::vector<int> indents{0};
    std::vector<std::size_t> scope_stack{0};
    std::vector<std::size_t> brackets;
    bool expect_indent = false;
    std::size_t i = 0;
    while(i<n){
        if(!significant(tokens_[i])){ ++i; continue; }
        const Token& head = tokens_[i];
        int width = indent_width(i);
        if(expect_indent){
            if(width <= indents.back()) throw parse_error("expected an indented block", head.line, head.col);
            indents.push_back(width);
            expect_indent = false;
        } else if(width > indents.back()){
            throw parse_error("unexpected indent", head.line, head.col);
        } else {
            while(width < indents.back()) indents.pop_back();
            if(width != indents.back()) throw parse_error("unindent does not match any outer indentation level", head.line, head.col);
        }
        const int depth = static_cast<int>(indents.size()) - 1;
        while(scope_stack.size()>1 && scopes_[scope_stack.back()].body_depth > depth) scope_stack.pop_back();

        // One logical line: up to a newline outside brackets, split on top-level ';'.
        std::vector<std::pair<std::size_t,std::size_t>> parts;
        std::size_t part_start = i;
        for(; i<n; ++i){
            const Token& t = tokens_[i];
            if(t.kind==TokenKind::Open){ brackets.push_back(i); continue; }
            if(t.kind==TokenKind::Close){
                if(brackets.empty()) throw parse_error("unmatched '" + std::string(token_text(i)) + "'", t.line, t.col);
                std::size_t o = brackets.back();
                char oc = text_[tokens_[o].begin], cc = text_[t.begin];
                if((oc=='(' && cc!=')') || (oc=='[' && cc!=']') || (oc=='{' && cc!='}'))
                    throw parse_error(std::string("closing '") + cc + "' does not match opening '" + oc + "'", t.line, t.col);
                partner_[o] = i; partner_[i] = o;
                brackets.pop_back();
                continue;
            }
            if(!brackets.empty()) continue;
            if(t.kind==TokenKind::Newline) break;
            if(t.kind==TokenKind::Op && token_text(i)==";"){ parts.emplace_back(part_start, i); part_start = i+1; }
        }
        if(!brackets.empty()){
            const Token& o = tokens_[brackets.front()];
            throw parse_error("'" + std::string(token_text(brackets.front())) + "' was never closed", o.line, o.col);
        }
        parts.emplace_back(part_start, i);
        const std::size_t line_end = i<n ? tokens_[i].end : text_.size();

        std::vector<std::pair<std::size_t,std::size_t>> spans;
        for(auto [b, e] : parts){
            std::size_t fb = b; while(fb<e && !significant(tokens_[fb])) ++fb;
            if(fb==e) continue;
            std::size_t le = e; while(le>fb && !significant(tokens_[le-1])) --le;
            spans.emplace_back(fb, le);
        }
        if(spans.empty()) throw parse_error("invalid syntax", head.line, head.col);
        bool trailing_comment = false;
        for(std::size_t k=spans.back().second; k<i; ++k) if(tokens_[k].kind==TokenKind::Comment) trailing_comment = true;

        for(std::size_t p=0; p<spans.size(); ++p){
            Statement st;
            st.first_tok = spans[p].first;
            st.end_tok = spans[p].second;
            st.depth = depth;
            st.scope = scope_stack.back();
            st.begin = tokens_[st.first_tok].begin;
            st.end = tokens_[st.end_tok-1].end;
            st.line = tokens_[st.first_tok].line;
            st.col = tokens_[st.first_tok].col;
            std::size_t ls = st.begin==0 ? npos : text_.rfind('\n', st.begin-1);
            st.line_begin = ls==npos ? 0 : ls+1;
            st.line_end = line_end;
            st.whole_line = spans.size()==1 && !trailing_comment;
            for(std::size_t k=st.first_tok; k<st.end_tok; ++k) if(significant(tokens_[k])) stmt_of_[k] = statements_.size();
            finish_statement(st);
            bool last = p+1==spans.size();
            if(!last) st.opens_block = false;
            statements_.push_back(std::move(st));
        }

        const Statement& tail = statements_.back();
        if(tail.opens_block){
            expect_indent = true;
            if(tail.kind==StatementKind::Def || tail.kind==StatementKind::Class){
                Scope sc;
                sc.kind = tail.kind==StatementKind::Def ? ScopeKind::Function : ScopeKind::Class;
                std::size_t kw = tail.first_tok;
                if(is_name(kw, "async")) kw = next_significant(kw);
                std::size_t nm = next_significant(kw);
                if(nm<tail.end_tok && tokens_[nm].kind==TokenKind::Name) sc.name = std::string(token_text(nm));
                sc.parent = scope_stack.back();
                sc.header_stmt = statements_.size()-1;
                sc.body_depth = depth+1;
                scopes_.push_back(std::move(sc));
                scope_stack.push_back(scopes_.size()-1);
            }
        }
        ++i;
    }
    if(expect_indent){
        int line = tokens_.empty() ? 1 : tokens_.back().line + 1;
        throw parse_error("expected an indented block", line, 1);
    }
}

void SourceUnit::finish_statement(Statement& st){
    static const char* compound[] = {"if","elif","else","for","while","with","try","except","finally","def","class","async"};
    std::string_view head = token_text(st.first_tok);
    std::size_t second = next_significant(st.first_tok);
    bool has_second = second!=npos && second<st.end_tok;

    if(head=="import") st.kind = StatementKind::Import;
    else if(head=="from") st.kind = StatementKind::FromImport;
    else if(head=="def" || (head=="async" && has_second && is_name(second, "def"))) st.kind = StatementKind::Def;
    else if(head=="class") st.kind = StatementKind::Class;

    bool is_compound = false;
    if(tokens_[st.first_tok].kind==TokenKind::Name) for(auto c : compound) if(head==c) is_compound = true;

    st.body_tok = st.first_tok;
    if(is_compound){
        st.body_tok = st.end_tok;
        int lambdas = 0;
        for(std::size_t k=st.first_tok; k<st.end_tok; ++k){
            if(!significant(tokens_[k])) continue;
            if(tokens_[k].kind==TokenKind::Open){ k = partner_[k]; continue; }
            if(is_name(k, "lambda")) ++lambdas;
            else if(is_op(k, ":")){
                if(lambdas){ --lambdas; continue; }
                std::size_t nx = next_significant(k);
                st.body_tok = (nx==npos || nx>=st.end_tok) ? st.end_tok : nx;
                break;
            }
        }
    }
    st.opens_block = is_op(st.end_tok-1, ":");

    if(st.kind==StatementKind::Import || st.kind==StatementKind::FromImport){
        st.import = parse_import(st, st.first_tok);
        return;
    }
    if(st.kind==StatementKind::Def || st.kind==StatementKind::Class) return;
    if(st.body_tok<st.end_tok && (is_name(st.body_tok, "import") || is_name(st.body_tok, "from"))){
        st.import = parse_import(st, st.body_tok);
        return;
    }

    static const char* assign_ops[] = {"=","+=","-=","*=","/=","//=","%=","**=",">>=","<<=","&=","|=","^=","@="};
    for(std::size_t k=st.body_tok; k<st.end_tok; ++k){
        if(!significant(tokens_[k])) continue;
        if(tokens_[k].kind==TokenKind::Open){ k = partner_[k]; continue; }
        if(tokens_[k].kind!=TokenKind::Op) continue;
        for(auto op : assign_ops) if(token_text(k)==op){ st.kind = StatementKind::Assign; return; }
    }
    st.kind = st.body_tok<st.end_tok ? StatementKind::Expression : StatementKind::Other;
}

ImportInfo SourceUnit::parse_import(const Statement& st, std::size_t first) const {
    ImportInfo info;
    std::vector<std::size_t> toks;
    for(std::size_t k=first; k<st.end_tok; ++k) if(significant(tokens_[k])) toks.push_back(k);
    std::size_t p = 1;
    auto fail = [&]{ throw parse_error("invalid import statement", st.line, st.col); };
    auto is_name_at = [&](std::size_t q){ return q<toks.size() && tokens_[toks[q]].kind==TokenKind::Name; };
    auto dotted = [&](std::string& out)->bool{
        if(!is_name_at(p)) return false;
        out = std::string(token_text(toks[p])); ++p;
        while(p+1<toks.size() && is_op(toks[p], ".") && is_name_at(p+1)){
            out += "."; out += token_text(toks[p+1]); p += 2;
        }
        return true;
    };
    auto alias = [&](ImportAlias& a){
        if(p<toks.size() && is_name(toks[p], "as")){
            ++p;
            if(!is_name_at(p)) fail();
            a.asname = std::string(token_text(toks[p])); ++p;
        }
    };

    if(is_name(first, "import")){
        for(;;){
            if(p>=toks.size()) fail();
            ImportAlias a; a.tok = toks[p];
            if(!dotted(a.name)) fail();
            alias(a);
            info.names.push_back(std::move(a));
            if(p<toks.size() && is_op(toks[p], ",")){ ++p; continue; }
            break;
        }
        if(p!=toks.size()) fail();
        return info;
    }

    info.from = true;
    while(p<toks.size() && (is_op(toks[p], ".") || is_op(toks[p], "..."))){ info.module += token_text(toks[p]); ++p; }
    if(p<toks.size() && !is_name(toks[p], "import")){
        std::string mod;
        if(!dotted(mod)) fail();
        info.module += mod;
    }
    if(info.module.empty() || p>=toks.size() || !is_name(toks[p], "import")) fail();
    ++p;
    if(p<toks.size() && is_op(toks[p], "*")){
        info.star = true; ++p;
    } else {
        bool paren = p<toks.size() && tokens_[toks[p]].kind==TokenKind::Open;
        if(paren) ++p;
        while(p<toks.size()){
            if(paren && tokens_[toks[p]].kind==TokenKind::Close) break;
            if(!is_name_at(p)) fail();
            ImportAlias a; a.tok = toks[p];
            a.name = std::string(token_text(toks[p])); ++p;
            alias(a);
            info.names.push_back(std::move(a));
            if(p<toks.size() && is_op(toks[p], ",")){ ++p; continue; }
            break;
        }
        if(paren){
            if(p>=toks.size() || tokens_[toks[p]].kind!=TokenKind::Close) fail();
            ++p;
        }
        if(info.names.empty()) fail();
    }
    if(p!=toks.size()) fail();
    return info;
}

void SourceUnit::advance(RewriteState next){
    if(next < state_)
        throw std::logic_error(std::string("rewrite state cannot move from ") + to_string(state_) + " back to " + to_string(next));
    state_ = next;
}

void SourceUnit::add_edit(Edit e){
    if(state_==RewriteState::Finalized) throw std::logic_error("edit on a finalized source unit");
    if(e.begin>e.end || e.end>text_.size()) throw std::out_of_range("edit outside the source text");
    for(const auto& x : edits_){
        bool overlap = e.begin < x.end && x.begin < e.end;
        if(e.begin==e.end && x.begin<e.begin && e.begin<x.end) overlap = true;
        if(x.begin==x.end && e.begin<x.begin && x.begin<e.end) overlap = true;
        if(overlap) throw std::logic_error("overlapping edits at byte " + std::to_string(e.begin));
    }
    edits_.push_back(std::move(e));
}

} // namespace infrar
