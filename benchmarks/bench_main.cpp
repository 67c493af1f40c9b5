#include "infrar/driver.hpp"
#include "infrar/errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_transform; size_t out_bytes; size_t sites; };

static RunResult bench_case(const char* name, const std::string &program, infrar::Provider p, const infrar::RuleRepository& rules){
    auto t0 = Clock::now();
    infrar::TransformResult r;
    try {
        r = infrar::transform(program, p, rules);
    } catch(const infrar::parse_error& e){
        std::cerr << "[bench] case '" << name << "' failed to parse: " << e.what() << "\n";
        return {0.0, 0, 0};
    }
    auto t1 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(), r.output.size(), r.transformed.size() };
}

// `n` functions, each with a handful of SDK calls and some unrelated code.
static std::string many_functions(int n){
    std::string s = "import os\nfrom infrar.storage import upload, download, delete\n\n";
    for(int i=0;i<n;++i){
        std::string id = std::to_string(i);
        s += "def job_" + id + "(bucket, day):\n"
             "    path = os.path.join('out', day, 'part-" + id + ".csv')\n"
             "    download(bucket, 'raw/" + id + ".csv', path)\n"
             "    upload(bucket=bucket, source=path, destination=f'done/{day}/" + id + ".csv')\n"
             "    if day:\n"
             "        delete(bucket, path='raw/" + id + ".csv')\n"
             "    return path\n\n";
    }
    return s;
}

// Long module with no SDK calls: measures scanning cost alone.
static std::string plain_code(int n){
    std::string s;
    for(int i=0;i<n;++i){
        std::string id = std::to_string(i);
        s += "value_" + id + " = [x * " + id + " for x in range(10) if x % 2]  # comment " + id + "\n";
    }
    return s;
}

// Outer calls whose first argument is another SDK call.
static std::string nested_calls(int n){
    std::string s = "from infrar.storage import upload, download\n";
    for(int i=0;i<n;++i) s += "upload(download('b', 'k" + std::to_string(i) + "', 'x'), 'y', 'z')\n";
    return s;
}

int main(){
    int scale = 200;
    if(const char* v = std::getenv("INFRAR_BENCH_SCALE")) scale = std::max(1, std::atoi(v));

    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;
    cases.push_back({ "many_functions", many_functions(scale) });
    cases.push_back({ "plain_code", plain_code(scale * 10) });
    cases.push_back({ "nested_calls", nested_calls(scale) });

    infrar::RuleRepository rules = infrar::RuleRepository::builtin();
    std::cout << "name,provider,ms_transform,out_bytes,sites\n";
    for(const auto &c : cases){
        for(auto p : infrar::all_providers){
            auto r = bench_case(c.name, c.prog, p, rules);
            std::cout << c.name << "," << infrar::to_string(p) << "," << r.ms_transform << "," << r.out_bytes << "," << r.sites << "\n";
        }
    }
    return 0;
}
