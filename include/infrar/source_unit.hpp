// SourceUnit: one parsed input file. Owns the text, the token list, the statement
// structure and the pending edits; the Emitter turns it back into text.
#pragma once
#include "infrar/syntax/token.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace infrar {

inline constexpr std::size_t npos = static_cast<std::size_t>(-1);

enum class StatementKind { Import, FromImport, Def, Class, Assign, Expression, Other };

struct ImportAlias {
    std::string name;   // dotted for `import a.b`, plain for `from m import name`
    std::string asname; // empty when no `as`
    std::size_t tok;    // first token of the alias
};

struct ImportInfo {
    bool from = false;
    std::string module;  // `from` module; leading dots kept for relative imports
    std::vector<ImportAlias> names;
    bool star = false;
};

// Name an import alias binds in the enclosing scope.
inline std::string bound_name(const ImportInfo& imp, const ImportAlias& a){
    if(!a.asname.empty()) return a.asname;
    if(imp.from) return a.name;
    auto dot = a.name.find('.');
    return dot == std::string::npos ? a.name : a.name.substr(0, dot);
}

// Dotted path the bound name refers to.
inline std::string bound_target(const ImportInfo& imp, const ImportAlias& a){
    if(imp.from) return imp.module + "." + a.name;
    if(!a.asname.empty()) return a.name;
    auto dot = a.name.find('.');
    return dot == std::string::npos ? a.name : a.name.substr(0, dot);
}

struct Statement {
    StatementKind kind = StatementKind::Other;
    std::size_t first_tok = 0;   // [first_tok, end_tok) covers the statement's tokens
    std::size_t end_tok = 0;
    std::size_t body_tok = 0;    // first token after a compound header's ':', else first_tok
    std::size_t begin = 0;       // byte span of the statement text
    std::size_t end = 0;
    int line = 0;
    int col = 0;
    int depth = 0;               // block nesting level
    std::size_t scope = 0;       // index into SourceUnit::scopes()
    bool opens_block = false;    // ends with ':' and owns the following indented block
    bool whole_line = false;     // alone on its physical line(s), no trailing comment
    std::size_t line_begin = 0;  // physical line span including the trailing newline
    std::size_t line_end = 0;
    std::optional<ImportInfo> import; // also set for a one-line `if c: import m` body

    // A statement of its own, not the body of a one-line compound statement.
    bool plain_import() const { return import && body_tok == first_tok; }
    // Token belongs to the import part of the statement.
    bool in_import(std::size_t tok) const { return import && tok >= body_tok; }
};

enum class ScopeKind { Module, Function, Class };

struct Scope {
    ScopeKind kind = ScopeKind::Module;
    std::string name;
    std::size_t parent = npos;
    std::size_t header_stmt = npos;
    int body_depth = 0;
};

enum class RewriteState { Unmodified, PartiallyRewritten, Finalized };
const char* to_string(RewriteState s);

// Replace [begin, end) of the original text; begin == end inserts.
struct Edit {
    std::size_t begin;
    std::size_t end;
    std::string text;
};

class SourceUnit {
public:
    // Tokenizes and structures the text. Throws parse_error when the text is malformed.
    explicit SourceUnit(std::string text, std::string name = "<memory>");

    const std::string& text() const { return text_; }
    const std::string& name() const { return name_; }
    const std::vector<syntax::Token>& tokens() const { return tokens_; }
    std::string_view token_text(std::size_t i) const { return std::string_view(text_).substr(tokens_[i].begin, tokens_[i].end - tokens_[i].begin); }
    std::string_view span_text(std::size_t begin, std::size_t end) const { return std::string_view(text_).substr(begin, end - begin); }
    bool is_op(std::size_t i, std::string_view op) const { return i < tokens_.size() && tokens_[i].kind == syntax::TokenKind::Op && token_text(i) == op; }
    bool is_name(std::size_t i, std::string_view n) const { return i < tokens_.size() && tokens_[i].kind == syntax::TokenKind::Name && token_text(i) == n; }

    const std::vector<Statement>& statements() const { return statements_; }
    const std::vector<Scope>& scopes() const { return scopes_; }

    // Matching bracket of an Open/Close token, npos otherwise.
    std::size_t partner(std::size_t tok) const { return partner_[tok]; }
    // Statement containing a significant token, npos for comments and newlines between statements.
    std::size_t statement_of(std::size_t tok) const { return stmt_of_[tok]; }
    // Neighbouring tokens skipping comments, newlines and continuations; npos at the ends.
    std::size_t next_significant(std::size_t tok) const;
    std::size_t prev_significant(std::size_t tok) const;

    RewriteState state() const { return state_; }
    // Moves the state machine forward; moving backward is a logic error.
    void advance(RewriteState next);

    // Records an edit. Overlapping edits or edits on a Finalized unit are logic errors.
    void add_edit(Edit e);
    const std::vector<Edit>& edits() const { return edits_; }

private:
    std::string text_;
    std::string name_;
    std::vector<syntax::Token> tokens_;
    std::vector<std::size_t> partner_;
    std::vector<std::size_t> stmt_of_;
    std::vector<Statement> statements_;
    std::vector<Scope> scopes_;
    std::vector<Edit> edits_;
    RewriteState state_ = RewriteState::Unmodified;

    void build();
    int indent_width(std::size_t tok) const;
    void finish_statement(Statement& st);
    ImportInfo parse_import(const Statement& st, std::size_t first) const;
};

inline bool significant(const syntax::Token& t){
    return t.kind != syntax::TokenKind::Comment && t.kind != syntax::TokenKind::Newline && t.kind != syntax::TokenKind::Continuation;
}

} // namespace infrar
