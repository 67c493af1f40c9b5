#include "infrar/diagnostics.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace infrar {

int edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap to avoid large allocs; positional fallback
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist; dist += (int)std::max(n,m)-(int)std::min(n,m); return dist; }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i){ for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c}); } }
    return dp[n][m];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::string> out;
    for(auto &c: pool){ if(c.empty()||c==target) continue; if(edit_distance(target,c)<=maxDist) out.push_back(c); }
    if(out.size()>5) out.resize(5);
    return out;
}

void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs){
    if(suggs.empty()) return;
    // Default ON when unset; explicit 0 disables.
    if(const char* env = std::getenv("INFRAR_SUGGEST")){ if(env[0]=='0') return; }
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+="'"+suggs[i]+"'"; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    d.notes.push_back(DiagNote{msg,d.line,d.col});
}

std::string format_diagnostic(const Diagnostic& d, const std::string& file){
    std::ostringstream os;
    if(!file.empty()) os << file << ":";
    if(d.line>=0) os << d.line << ":" << d.col << ": ";
    else if(!file.empty()) os << " ";
    os << (d.code.empty() || d.code[0]=='E' ? "error" : "warning");
    if(!d.code.empty()) os << "[" << d.code << "]";
    os << ": " << d.message << "\n";
    if(!d.hint.empty()) os << "  hint: " << d.hint << "\n";
    for(auto &n : d.notes){ os << "  note: " << n.message; if(n.line>=0) os << " (line "<<n.line<<":"<<n.col<<")"; os << "\n"; }
    return os.str();
}

} // namespace infrar
