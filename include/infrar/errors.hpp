// Fatal error types. Per-site problems are Diagnostics, never exceptions.
#pragma once
#include <stdexcept>
#include <string>

namespace infrar {

// Source text could not be parsed; aborts the file, never the batch.
struct parse_error : std::runtime_error
{
    parse_error(const std::string &msg, int line, int col)
        : std::runtime_error(msg), line(line), col(col) {}
    int line;
    int col;
};

// A recognized function has no rule for the requested provider; aborts the provider run.
struct missing_rule_error : std::runtime_error
{
    missing_rule_error(const std::string &function, const std::string &provider)
        : std::runtime_error("no transform rule for '" + function + "' on provider '" + provider + "'"),
          function(function), provider(provider) {}
    std::string function;
    std::string provider;
};

// The rule source is malformed or inconsistent; raised at load time before any file is processed.
struct rule_error : std::runtime_error
{
    rule_error(const std::string &msg, int line = -1, int col = -1)
        : std::runtime_error(line >= 0 ? msg + " (line " + std::to_string(line) + ":" + std::to_string(col) + ")" : msg),
          line(line), col(col) {}
    int line;
    int col;
};

} // namespace infrar
