#include "infrar/emitter.hpp"
#include <algorithm>

namespace infrar {

std::string emit(const SourceUnit& unit){
    const std::string& src = unit.text();
    if(unit.edits().empty()) return src;
    std::vector<Edit> edits = unit.edits();
    // Insertions sort before a replacement starting at the same offset.
    std::stable_sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b){
        return a.begin!=b.begin ? a.begin<b.begin : a.end<b.end;
    });
    std::string out;
    out.reserve(src.size() + 256);
    std::size_t pos = 0;
    for(const auto& e : edits){
        out.append(src, pos, e.begin - pos);
        out += e.text;
        pos = e.end;
    }
    out.append(src, pos, std::string::npos);
    return out;
}

} // namespace infrar
