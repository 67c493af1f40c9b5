#include "infrar/report_json.hpp"
#include <sstream>
#include <cstdio>

namespace infrar {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_strings_json(std::ostringstream& os, const std::vector<std::string>& v){
    os<<"[";
    for(size_t i=0;i<v.size(); ++i){ if(i) os<<","; os<<json_escape(v[i]); }
    os<<"]";
}

static void append_diag_json(std::ostringstream& os, const Diagnostic& d, const std::string& file){
    os<<"{\"file\":"<<json_escape(file)
      <<",\"line\":"<<d.line
      <<",\"column\":"<<d.col
      <<",\"code\":"<<json_escape(d.code)
      <<",\"reason\":"<<json_escape(d.message)
      <<",\"hint\":"<<json_escape(d.hint)
      <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)
          <<",\"line\":"<<d.notes[i].line
          <<",\"col\":"<<d.notes[i].col
          <<"}";
    }
    os<<"]}";
}

std::string skipped_to_json(const std::vector<Diagnostic>& skipped, const std::string& file){
    std::ostringstream os;
    os<<"[";
    for(size_t i=0;i<skipped.size(); ++i){ if(i) os<<","; append_diag_json(os, skipped[i], file); }
    os<<"]";
    return os.str();
}

static void append_result_fields(std::ostringstream& os, const TransformResult& r, const std::string& file){
    os<<"\"state\":"<<json_escape(to_string(r.state))
      <<",\"transformed\":[";
    for(size_t i=0;i<r.transformed.size(); ++i){
        const auto& s=r.transformed[i]; if(i) os<<",";
        os<<"{\"function\":"<<json_escape(s.function)
          <<",\"line\":"<<s.line
          <<",\"column\":"<<s.col
          <<"}";
    }
    os<<"],\"skipped\":"<<skipped_to_json(r.skipped, file)
      <<",\"inserted_imports\":";
    append_strings_json(os, r.inserted_imports);
    os<<",\"inserted_setup\":";
    append_strings_json(os, r.inserted_setup);
    os<<",\"pruned_imports\":";
    append_strings_json(os, r.pruned_imports);
}

std::string result_to_json(const TransformResult& r, const std::string& file){
    std::ostringstream os;
    os<<"{\"file\":"<<json_escape(file)<<",";
    append_result_fields(os, r, file);
    os<<"}";
    return os.str();
}

std::string report_to_json(const std::vector<FileReport>& reports, Provider provider){
    std::ostringstream os;
    os<<"{\"provider\":"<<json_escape(to_string(provider))<<",\"files\":[";
    for(size_t i=0;i<reports.size(); ++i){
        const auto& f=reports[i]; if(i) os<<",";
        os<<"{\"file\":"<<json_escape(f.path)
          <<",\"output\":"<<json_escape(f.output_path)
          <<",\"ok\":"<<(f.ok?"true":"false");
        if(f.error){ os<<",\"error\":"; append_diag_json(os, *f.error, f.path); }
        else { os<<","; append_result_fields(os, f.result, f.path); }
        os<<"}";
    }
    os<<"],\"skipped\":[";
    bool first=true;
    for(const auto& f : reports){
        for(const auto& d : f.result.skipped){ if(!first) os<<","; first=false; append_diag_json(os, d, f.path); }
    }
    os<<"]}";
    return os.str();
}

} // namespace infrar
