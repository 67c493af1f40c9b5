#include "infrar/resolver.hpp"
#include <cctype>

namespace infrar {

namespace {

ResolveResult skipped(Diagnostic d){
    ResolveResult r;
    r.ok = false;
    r.skip = std::move(d);
    return r;
}

} // namespace

ResolveResult resolve_arguments(const CallSite& site, const Signature& sig, const TransformRule& rule){
    ErrorReporter rep;
    const std::string fn = "'" + site.callee + "'";

    if(rule.no_capture && site.context!=CallContext::Statement){
        const char* how = site.context==CallContext::Assigned ? "assigned to a variable"
                        : site.context==CallContext::Returned ? "returned" : "used inside an expression";
        return skipped(rep.make(diag::CaptureUnsupported, std::string("capture unsupported: result of ") + fn + " is " + how,
                                "the " + std::string(to_string(rule.provider)) + " equivalent has no single-expression form; call it as a statement",
                                site.line, site.col));
    }

    ResolveResult out;
    std::size_t positional = 0;
    bool seen_keyword = false;
    for(const auto& a : site.args){
        if(a.star || a.double_star)
            return skipped(rep.make(diag::StarArgument, std::string(a.double_star ? "'**'" : "'*'") + " argument unpacking in " + fn + " is unsupported",
                                    "pass each argument explicitly", a.line, a.col));
        std::string pname;
        if(a.name.empty()){
            if(seen_keyword)
                return skipped(rep.make(diag::TooManyArguments, "positional argument follows keyword argument in " + fn, "", a.line, a.col));
            if(positional>=sig.params.size())
                return skipped(rep.make(diag::TooManyArguments, fn + " takes " + std::to_string(sig.params.size()) + " positional arguments but more were given",
                                        "", a.line, a.col));
            pname = sig.params[positional++].name;
        } else {
            seen_keyword = true;
            if(!sig.param(a.name)){
                std::vector<std::string> pool;
                for(auto& p : sig.params) pool.push_back(p.name);
                auto d = rep.make(diag::UnknownArgument, "unrecognized argument name '" + a.name + "' in " + fn,
                                  "expected one of the parameters of " + sig.qualified(), a.line, a.col);
                append_suggestions(d, fuzzy_candidates(a.name, pool));
                return skipped(std::move(d));
            }
            pname = a.name;
        }
        if(out.args.values.count(pname))
            return skipped(rep.make(diag::DuplicateArgument, fn + " got multiple values for argument '" + pname + "'", "", a.line, a.col));
        out.args.values[pname] = ResolvedValue{a.text, a.literal, false};
    }

    for(const auto& p : sig.params){
        if(out.args.values.count(p.name)) continue;
        if(!p.default_value)
            return skipped(rep.make(diag::MissingArgument, fn + " is missing required argument '" + p.name + "'", "", site.line, site.col));
        const std::string& dv = *p.default_value;
        bool lit = !dv.empty() && (dv[0]=='"' || dv[0]=='\'' || std::isdigit((unsigned char)dv[0]) || dv=="True" || dv=="False" || dv=="None");
        out.args.values[p.name] = ResolvedValue{dv, lit, true};
    }
    out.ok = true;
    return out;
}

} // namespace infrar
