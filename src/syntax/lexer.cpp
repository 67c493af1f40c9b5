#include "infrar/syntax/token.hpp"
#include "infrar/syntax/grammar.hpp"
#include "infrar/errors.hpp"
#include <tao/pegtl.hpp>

namespace infrar::syntax {

namespace {

struct lex_state {
    const char* base;
    std::vector<Token>* out;
};

template<typename Rule>
struct action : tao::pegtl::nothing<Rule> {};

template<TokenKind K>
struct push_token {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        auto p = in.position();
        st.out->push_back(Token{ K, static_cast<std::size_t>(in.begin() - st.base), static_cast<std::size_t>(in.end() - st.base),
                                 static_cast<int>(p.line), static_cast<int>(p.column) });
    }
};

template<> struct action< grammar::name > : push_token<TokenKind::Name> {};
template<> struct action< grammar::number > : push_token<TokenKind::Number> {};
template<> struct action< grammar::string_lit > : push_token<TokenKind::String> {};
template<> struct action< grammar::op > : push_token<TokenKind::Op> {};
template<> struct action< grammar::open_bracket > : push_token<TokenKind::Open> {};
template<> struct action< grammar::close_bracket > : push_token<TokenKind::Close> {};
template<> struct action< grammar::comment > : push_token<TokenKind::Comment> {};
template<> struct action< grammar::newline > : push_token<TokenKind::Newline> {};
template<> struct action< grammar::continuation > : push_token<TokenKind::Continuation> {};

} // namespace

std::vector<Token> tokenize(std::string_view src, const std::string& source_name){
    std::vector<Token> toks;
    lex_state st{ src.data(), &toks };
    tao::pegtl::memory_input<> in(src.data(), src.size(), source_name);
    try {
        tao::pegtl::parse< grammar::file, action, grammar::control >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        const auto& p = e.positions().front();
        throw infrar::parse_error(std::string(e.message()), static_cast<int>(p.line), static_cast<int>(p.column));
    }
    return toks;
}

} // namespace infrar::syntax
