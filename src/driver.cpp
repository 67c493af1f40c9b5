#include "infrar/driver.hpp"
#include "infrar/emitter.hpp"
#include "infrar/errors.hpp"
#include "infrar/resolver.hpp"
#include "infrar/rewriter.hpp"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <exception>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>

namespace infrar {

TransformResult transform(std::string_view source, Provider provider, const RuleRepository& rules,
                          const TransformOptions& opts, const std::string& name){
    SourceUnit unit{std::string(source), name};
    const Scanner scanner(unit, rules, opts.debug_scan);
    ScanResult scan = scanner.scan();

    TransformResult res;
    res.skipped = std::move(scan.skipped);
    std::vector<PlannedRewrite> plan;
    for(const auto& site : scan.sites){
        const TransformRule* rule = rules.lookup(site.function, provider);
        if(!rule) throw missing_rule_error(site.function, to_string(provider));
        const Signature* sig = rules.signature(site.function);
        ResolveResult rr = resolve_arguments(site, *sig, *rule);
        if(!rr.ok){
            if(opts.debug_rewrite) std::fprintf(stderr, "[dbg][rewrite] skip %d:%d %s: %s\n", site.line, site.col, rr.skip.code.c_str(), rr.skip.message.c_str());
            res.skipped.push_back(std::move(rr.skip));
            continue;
        }
        plan.push_back(PlannedRewrite{&site, rule, std::move(rr.args)});
    }

    RewriteOptions ro;
    ro.prune_imports = opts.prune_imports;
    ro.debug = opts.debug_rewrite;
    RewriteSummary sum = Rewriter(unit, rules, scanner, ro).apply(plan);
    for(auto& d : sum.conflicts) res.skipped.push_back(std::move(d));

    res.output = emit(unit);
    res.state = unit.state();
    for(auto* s : sum.rewritten) res.transformed.push_back(*s);
    res.inserted_imports = std::move(sum.inserted_imports);
    res.inserted_setup = std::move(sum.inserted_setup);
    res.pruned_imports = std::move(sum.pruned_imports);
    std::stable_sort(res.skipped.begin(), res.skipped.end(), [](const Diagnostic& a, const Diagnostic& b){
        return a.line!=b.line ? a.line<b.line : a.col<b.col;
    });
    return res;
}

namespace {

bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return false;
    std::stringstream ss; ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

bool write_file(const std::string& path, const std::string& text){
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if(!ofs) return false;
    ofs << text;
    return static_cast<bool>(ofs);
}

void run_one(const FileJob& job, FileReport& rep, Provider provider, const RuleRepository& rules, const TransformOptions& opts){
    rep.path = job.input;
    rep.output_path = job.output;
    std::string src;
    if(!read_file(job.input, src)){
        rep.error = Diagnostic{diag::IoError, "cannot read '" + job.input + "'", "", -1, -1, {}};
        return;
    }
    try {
        rep.result = transform(src, provider, rules, opts, job.input);
    } catch(const parse_error& e){
        rep.error = Diagnostic{diag::ParseError, e.what(), "the file was left untouched", e.line, e.col, {}};
        return;
    }
    if(!job.output.empty() && !write_file(job.output, rep.result.output)){
        rep.error = Diagnostic{diag::IoError, "cannot write '" + job.output + "'", "", -1, -1, {}};
        return;
    }
    rep.ok = true;
}

} // namespace

std::vector<FileReport> transform_files(const std::vector<FileJob>& files, Provider provider, const RuleRepository& rules,
                                        const TransformOptions& opts, unsigned jobs){
    std::vector<FileReport> reports(files.size());
    if(jobs==0) jobs = std::max(1u, std::thread::hardware_concurrency());
    jobs = static_cast<unsigned>(std::min<std::size_t>(jobs, std::max<std::size_t>(files.size(), 1)));

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};
    std::mutex mtx;
    std::exception_ptr fatal;
    auto worker = [&](){
        for(;;){
            if(stop.load()) return;
            std::size_t i = next.fetch_add(1);
            if(i>=files.size()) return;
            try {
                run_one(files[i], reports[i], provider, rules, opts);
            } catch(const std::exception&){
                // missing_rule_error, or anything else that is fatal for the run
                std::lock_guard<std::mutex> lk(mtx);
                if(!fatal) fatal = std::current_exception();
                stop.store(true);
                return;
            }
        }
    };
    std::vector<std::thread> pool;
    for(unsigned t=1; t<jobs; ++t) pool.emplace_back(worker);
    worker();
    for(auto& th : pool) th.join();
    if(fatal) std::rethrow_exception(fatal);
    return reports;
}

} // namespace infrar
