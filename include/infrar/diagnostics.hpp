// Coded diagnostics shared by the scanner, resolver, rewriter and driver
#pragma once
#include <string>
#include <vector>

namespace infrar {

// Diagnostic codes. E* are fatal for a file or a run, W* are per-site skips.
namespace diag {
inline constexpr const char* IoError             = "E0001";
inline constexpr const char* ParseError          = "E0100";
inline constexpr const char* MissingRule         = "E0200";
inline constexpr const char* RuleError           = "E0300";
inline constexpr const char* CaptureUnsupported  = "W0301";
inline constexpr const char* CommentInArguments  = "W0302";
inline constexpr const char* UnknownArgument     = "W0303";
inline constexpr const char* DuplicateArgument   = "W0304";
inline constexpr const char* TooManyArguments    = "W0305";
inline constexpr const char* MissingArgument     = "W0306";
inline constexpr const char* StarArgument        = "W0307";
inline constexpr const char* AmbiguousBinding    = "W0308";
inline constexpr const char* NameCollision       = "W0309";
}

struct DiagNote { std::string message; int line=-1; int col=-1; };
struct Diagnostic { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<DiagNote> notes; };

// Central reporter so every component formats skips the same way.
struct ErrorReporter {
    std::vector<Diagnostic>* sink=nullptr;
    void emit(const Diagnostic& d){ if(sink) sink->push_back(d); }
    Diagnostic make(std::string code, std::string message, std::string hint, int line, int col){ return Diagnostic{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
};

int edit_distance(const std::string& a, const std::string& b);
// Up to five entries of pool within maxDist edits of target.
std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);
// Adds a "did you mean" note unless INFRAR_SUGGEST=0.
void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs);

// One-line rendering: "line:col: warning[W0301]: message" plus hint/note lines.
std::string format_diagnostic(const Diagnostic& d, const std::string& file);

} // namespace infrar
