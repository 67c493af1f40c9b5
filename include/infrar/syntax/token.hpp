#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace infrar::syntax {

enum class TokenKind {
    Name,         // identifiers and keywords
    Number,
    String,       // any prefix, single or triple quoted
    Op,           // operators and delimiters other than brackets
    Open,         // ( [ {
    Close,        // ) ] }
    Comment,      // '#' to end of line
    Newline,      // physical line break
    Continuation  // backslash-newline
};

struct Token {
    TokenKind kind;
    std::size_t begin; // byte offsets into the source text
    std::size_t end;
    int line;
    int col;
};

// Tokenize Python source. Throws infrar::parse_error on an unterminated string or a
// character that starts no token.
std::vector<Token> tokenize(std::string_view src, const std::string& source_name = "<memory>");

inline bool is_keyword(std::string_view s){
    static const char* kws[] = {"False","None","True","and","as","assert","async","await","break","class","continue",
        "def","del","elif","else","except","finally","for","from","global","if","import","in","is","lambda",
        "nonlocal","not","or","pass","raise","return","try","while","with","yield"};
    for(auto k : kws) if(s==k) return true;
    return false;
}

} // namespace infrar::syntax
