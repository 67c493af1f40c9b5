#pragma once
#include <tao/pegtl.hpp>

// Lexical grammar for the Python subset the transformer reads. Every byte of the
// input belongs to exactly one token rule, so spans reassemble the original text.
namespace infrar::syntax::grammar {
using namespace tao::pegtl;

// Whitespace and comments
struct blanks : plus< sor< blank, one<'\f'>, seq< one<'\r'>, not_at< one<'\n'> > > > > {};
struct continuation : seq< one<'\\'>, eol > {};
struct newline : eol {};
struct comment : seq< one<'#'>, until< at< eolf > > > {};

// String literals: optional prefix (r, b, u, f and two-letter combinations), then
// single or triple quotes. Raw strings still cannot end in an odd backslash.
struct str_prefix : rep_max< 2, one<'r', 'R', 'b', 'B', 'u', 'U', 'f', 'F'> > {};
struct escaped : seq< one<'\\'>, sor< eol, any > > {};
struct tdq_body : until< three<'"'>, sor< escaped, any > > {};
struct tsq_body : until< three<'\''>, sor< escaped, any > > {};
struct dq_body : until< one<'"'>, sor< escaped, not_one<'\n', '\r'> > > {};
struct sq_body : until< one<'\''>, sor< escaped, not_one<'\n', '\r'> > > {};
struct tdq : seq< three<'"'>, must< tdq_body > > {};
struct tsq : seq< three<'\''>, must< tsq_body > > {};
struct dq : seq< one<'"'>, must< dq_body > > {};
struct sq : seq< one<'\''>, must< sq_body > > {};
struct string_lit : seq< opt< str_prefix >, sor< tdq, tsq, dq, sq > > {};

// Numbers
struct digitpart : seq< digit, star< opt< one<'_'> >, digit > > {};
struct hexnum : seq< one<'0'>, one<'x', 'X'>, plus< opt< one<'_'> >, xdigit > > {};
struct octnum : seq< one<'0'>, one<'o', 'O'>, plus< opt< one<'_'> >, range<'0', '7'> > > {};
struct binnum : seq< one<'0'>, one<'b', 'B'>, plus< opt< one<'_'> >, one<'0', '1'> > > {};
struct exponent : seq< one<'e', 'E'>, opt< one<'+', '-'> >, digitpart > {};
struct pointfloat : sor< seq< digitpart, one<'.'>, opt< digitpart > >, seq< one<'.'>, digitpart > > {};
struct decimal : seq< sor< pointfloat, digitpart >, opt< exponent > > {};
struct number : seq< sor< hexnum, octnum, binnum, decimal >, opt< one<'j', 'J'> > > {};

// Identifiers (ASCII plus any non-ASCII code point)
struct name_first : sor< ranges<'a', 'z', 'A', 'Z', '_'>, utf8::range<0x80, 0x10FFFF> > {};
struct name_other : sor< ranges<'a', 'z', 'A', 'Z', '0', '9', '_'>, utf8::range<0x80, 0x10FFFF> > {};
struct name : seq< name_first, star< name_other > > {};

// Operators, longest first
struct op : sor<
    string<'*', '*', '='>, string<'/', '/', '='>, string<'>', '>', '='>, string<'<', '<', '='>, string<'.', '.', '.'>,
    string<'-', '>'>, string<':', '='>, string<'*', '*'>, string<'/', '/'>, string<'<', '<'>, string<'>', '>'>,
    string<'<', '='>, string<'>', '='>, string<'=', '='>, string<'!', '='>,
    string<'+', '='>, string<'-', '='>, string<'*', '='>, string<'/', '='>, string<'%', '='>,
    string<'&', '='>, string<'|', '='>, string<'^', '='>, string<'@', '='>,
    one<'+', '-', '*', '/', '%', '@', '&', '|', '^', '~', '<', '>', '=', '.', ',', ':', ';'> > {};
struct open_bracket : one<'(', '[', '{'> {};
struct close_bracket : one<')', ']', '}'> {};

struct token : sor< blanks, continuation, newline, comment, string_lit, number, name, op, open_bracket, close_bracket > {};
struct file : seq< opt< utf8::bom >, star< token >, must< eof > > {};

// Messages for must<> failures
template< typename Rule >
inline constexpr const char* error_message = "invalid syntax";
template<> inline constexpr const char* error_message< tdq_body > = "unterminated triple-quoted string literal";
template<> inline constexpr const char* error_message< tsq_body > = "unterminated triple-quoted string literal";
template<> inline constexpr const char* error_message< dq_body > = "unterminated string literal";
template<> inline constexpr const char* error_message< sq_body > = "unterminated string literal";
template<> inline constexpr const char* error_message< eof > = "invalid character in source";

template< typename Rule >
struct control : normal< Rule >
{
    template< typename Input, typename... States >
    [[noreturn]] static void raise( const Input& in, States&&... )
    {
        throw tao::pegtl::parse_error( error_message< Rule >, in );
    }
};

} // namespace infrar::syntax::grammar
