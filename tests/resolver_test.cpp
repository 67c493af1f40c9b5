#include <gtest/gtest.h>
#include "infrar/resolver.hpp"
#include "test_env.hpp"

using namespace infrar;

namespace {

const RuleRepository& rules(){
    static const RuleRepository repo = RuleRepository::builtin();
    return repo;
}

ResolveResult resolve_first(const std::string& call, Provider p = Provider::Aws){
    SourceUnit u("from infrar.storage import upload, delete, list_objects\n" + call + "\n");
    auto scanned = scan_calls(u, rules());
    EXPECT_EQ(scanned.sites.size(), 1u);
    if(scanned.sites.empty()) return ResolveResult{};
    const CallSite& site = scanned.sites[0];
    return resolve_arguments(site, *rules().signature(site.function), *rules().lookup(site.function, p));
}

}

TEST(ArgumentResolver, PositionalAndKeywordMix){
    auto r = resolve_first("upload('data', destination='b.csv', source=path)");
    ASSERT_TRUE(r.ok);
    const auto& v = r.args.values;
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v.at("bucket").text, "'data'");
    EXPECT_TRUE(v.at("bucket").literal);
    EXPECT_EQ(v.at("source").text, "path");
    EXPECT_FALSE(v.at("source").literal);
    EXPECT_EQ(v.at("destination").text, "'b.csv'");
}

TEST(ArgumentResolver, DefaultsFillOmittedParameters){
    auto r = resolve_first("list_objects('data')");
    ASSERT_TRUE(r.ok);
    ASSERT_EQ(r.args.values.count("prefix"), 1u);
    const ResolvedValue& prefix = r.args.values.at("prefix");
    EXPECT_EQ(prefix.text, "\"\"");
    EXPECT_TRUE(prefix.from_default);
    EXPECT_TRUE(prefix.literal);
}

TEST(ArgumentResolver, UnknownKeywordSuggestsParameter){
    test::put_env("INFRAR_SUGGEST=");
    auto r = resolve_first("upload(bucket='b', sorce='a', destination='c')");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.skip.code, diag::UnknownArgument);
    EXPECT_NE(r.skip.message.find("'sorce'"), std::string::npos);
    ASSERT_EQ(r.skip.notes.size(), 1u);
    EXPECT_EQ(r.skip.notes[0].message, "did you mean 'source'");
}

TEST(ArgumentResolver, DuplicateValue){
    auto r = resolve_first("upload('b', 's', 'd', bucket='x')");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.skip.code, diag::DuplicateArgument);
    EXPECT_NE(r.skip.message.find("'bucket'"), std::string::npos);
}

TEST(ArgumentResolver, TooManyOrMisorderedPositionals){
    auto r = resolve_first("upload('b', 's', 'd', 'e')");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.skip.code, diag::TooManyArguments);
    EXPECT_EQ(r.skip.col, 23);

    r = resolve_first("upload(bucket='b', 's', 'd')");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.skip.code, diag::TooManyArguments);
    EXPECT_NE(r.skip.message.find("follows keyword"), std::string::npos);
}

TEST(ArgumentResolver, MissingRequiredArgument){
    auto r = resolve_first("delete('b')");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.skip.code, diag::MissingArgument);
    EXPECT_NE(r.skip.message.find("'path'"), std::string::npos);
    EXPECT_EQ(r.skip.line, 2);
}

TEST(ArgumentResolver, UnpackingIsUnsupported){
    auto r = resolve_first("upload(*parts)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.skip.code, diag::StarArgument);
    r = resolve_first("upload('b', **opts)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.skip.code, diag::StarArgument);
}

TEST(ArgumentResolver, CapturedResultOfNoCaptureFunction){
    for(auto p : all_providers){
        auto r = resolve_first("found = list_objects('data')", p);
        ASSERT_FALSE(r.ok);
        EXPECT_EQ(r.skip.code, diag::CaptureUnsupported);
        EXPECT_EQ(r.skip.message.rfind("capture unsupported", 0), 0u);
        EXPECT_NE(r.skip.message.find("assigned"), std::string::npos);
    }
    auto ok = resolve_first("found = upload('b', 's', 'd')");
    EXPECT_TRUE(ok.ok);
}
