#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace infrar {

enum class Provider { Aws, Gcp, Azure };

inline constexpr std::array<Provider,3> all_providers{ Provider::Aws, Provider::Gcp, Provider::Azure };

inline const char* to_string(Provider p){
    switch(p){
        case Provider::Aws: return "aws";
        case Provider::Gcp: return "gcp";
        case Provider::Azure: return "azure";
    }
    return "?";
}

// Accepts the command-line spellings (aws, gcp, azure); case-insensitive.
inline std::optional<Provider> parse_provider(std::string_view s){
    std::string low; low.reserve(s.size());
    for(char c : s) low += (char)((c>='A' && c<='Z') ? c-'A'+'a' : c);
    if(low=="aws") return Provider::Aws;
    if(low=="gcp") return Provider::Gcp;
    if(low=="azure") return Provider::Azure;
    return std::nullopt;
}

} // namespace infrar
