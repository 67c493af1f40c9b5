#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include "infrar/driver.hpp"
#include "infrar/env.hpp"
#include "infrar/errors.hpp"
#include "infrar/report_json.hpp"
#include "infrar/rules.hpp"

using namespace infrar;

static void usage(std::ostream& os){
    os << "usage: infrar-transform --provider <aws|gcp|azure> --input <path> --output <path>\n"
          "                        [--input <path> --output <path> ...] [--rules <file>] [--report <file>]\n"
          "                        [--jobs N] [--no-prune-imports] [--dump-rules]\n"
          "  --output - writes the transformed text to stdout (single input only)\n";
}

static void dump_rules(const RuleRepository& repo){
    for(const auto& sig : repo.signatures()){
        std::cout << sig.qualified() << "(";
        for(size_t i=0;i<sig.params.size(); ++i){
            if(i) std::cout << ", ";
            std::cout << sig.params[i].name;
            if(sig.params[i].default_value) std::cout << "=" << *sig.params[i].default_value;
        }
        std::cout << ")\n";
        for(auto p : all_providers){
            const TransformRule* r = repo.lookup(sig.name, p);
            std::cout << "  " << to_string(p) << ": ";
            if(!r){ std::cout << "<no rule>\n"; continue; }
            std::cout << r->template_text;
            if(r->no_capture) std::cout << "  [no-capture]";
            std::cout << "\n";
        }
    }
}

int main(int argc, char** argv){
    TransformEnv env = detect_env();
    std::string providerName, reportPath;
    std::vector<std::string> inputs, outputs;
    bool dump = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        auto value = [&](std::string& out)->bool{ if(i+1>=argc){ std::cerr << "missing value for " << a << "\n"; return false; } out = argv[++i]; return true; };
        std::string v;
        if(a=="--provider"){ if(!value(providerName)){ usage(std::cerr); return 1; } }
        else if(a=="--input"){ if(!value(v)){ usage(std::cerr); return 1; } inputs.push_back(v); }
        else if(a=="--output"){ if(!value(v)){ usage(std::cerr); return 1; } outputs.push_back(v); }
        else if(a=="--rules"){ if(!value(env.rulesPath)){ usage(std::cerr); return 1; } }
        else if(a=="--report"){ if(!value(reportPath)){ usage(std::cerr); return 1; } }
        else if(a=="--jobs"){
            if(!value(v)){ usage(std::cerr); return 1; }
            try { env.jobs = static_cast<unsigned>(std::stoul(v)); }
            catch(const std::exception&){ std::cerr << "invalid --jobs value '" << v << "'\n"; return 1; }
        }
        else if(a=="--no-prune-imports") env.pruneImports = false;
        else if(a=="--dump-rules") dump = true;
        else if(a=="-h" || a=="--help"){ usage(std::cout); return 0; }
        else { std::cerr << "unknown argument '" << a << "'\n"; usage(std::cerr); return 1; }
    }

    RuleRepository repo;
    try {
        repo = env.rulesPath.empty() ? RuleRepository::builtin() : RuleRepository::load_file(env.rulesPath);
    } catch(const rule_error& e){
        std::cerr << "error[" << diag::RuleError << "]: " << e.what() << "\n";
        return 3;
    }
    if(dump){
        dump_rules(repo);
        if(inputs.empty()) return 0;
    }

    if(inputs.empty() || providerName.empty()){ usage(std::cerr); return 1; }
    auto provider = parse_provider(providerName);
    if(!provider){ std::cerr << "unknown provider '" << providerName << "' (expected aws, gcp or azure)\n"; return 1; }
    if(inputs.size()!=outputs.size()){ std::cerr << "each --input needs a matching --output\n"; return 1; }
    bool to_stdout = false;
    for(auto& o : outputs) if(o=="-") to_stdout = true;
    if(to_stdout && inputs.size()!=1){ std::cerr << "--output - requires a single input\n"; return 1; }

    try {
        repo.require_complete(*provider);
    } catch(const missing_rule_error& e){
        std::cerr << "error[" << diag::MissingRule << "]: " << e.what() << "\n";
        return 3;
    }

    std::vector<FileJob> jobs;
    for(size_t i=0;i<inputs.size();++i) jobs.push_back(FileJob{inputs[i], outputs[i]=="-" ? std::string() : outputs[i]});

    std::vector<FileReport> reports;
    try {
        reports = transform_files(jobs, *provider, repo, TransformOptions::from_env(env), env.jobs);
    } catch(const missing_rule_error& e){
        std::cerr << "error[" << diag::MissingRule << "]: " << e.what() << "\n";
        return 3;
    }

    int rc = 0;
    size_t rewritten = 0, skipped = 0, failed = 0;
    for(const auto& r : reports){
        if(r.error){
            std::cerr << format_diagnostic(*r.error, r.path);
            ++failed;
            if(r.error->code==diag::ParseError) rc = 2;
            else if(rc==0) rc = 1;
            continue;
        }
        for(const auto& d : r.result.skipped) std::cerr << format_diagnostic(d, r.path);
        rewritten += r.result.transformed.size();
        skipped += r.result.skipped.size();
        if(to_stdout) std::cout << r.result.output;
    }
    std::cerr << "[infrar] " << to_string(*provider) << ": " << reports.size() << " file(s), " << rewritten << " call(s) rewritten, "
              << skipped << " skipped, " << failed << " failed\n";

    if(!reportPath.empty()){
        std::ofstream ofs(reportPath);
        if(!ofs){ std::cerr << "cannot write report '" << reportPath << "'\n"; return 1; }
        ofs << report_to_json(reports, *provider) << "\n";
    }
    if(env.diagJson) std::cerr << report_to_json(reports, *provider) << "\n";
    return rc;
}
