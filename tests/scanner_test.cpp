#include <gtest/gtest.h>
#include "infrar/scanner.hpp"

using namespace infrar;

namespace {

const RuleRepository& rules(){
    static const RuleRepository repo = RuleRepository::builtin();
    return repo;
}

ScanResult scan(const std::string& src){
    SourceUnit u(src);
    return scan_calls(u, rules());
}

}

TEST(Scanner, EveryImportFormResolves){
    auto r = scan(
        "import infrar.storage\n"
        "import infrar.storage as st\n"
        "from infrar import storage\n"
        "from infrar.storage import upload as up\n"
        "\n"
        "infrar.storage.upload('b', 's', 'd')\n"
        "st.download('b', 's', 'd')\n"
        "storage.delete('b', 'p')\n"
        "up('b', 's', 'd')\n");
    ASSERT_EQ(r.sites.size(), 4u);
    EXPECT_TRUE(r.skipped.empty());
    EXPECT_EQ(r.sites[0].qualified, "infrar.storage.upload");
    EXPECT_EQ(r.sites[0].callee, "infrar.storage.upload");
    EXPECT_EQ(r.sites[1].function, "download");
    EXPECT_EQ(r.sites[1].callee, "st.download");
    EXPECT_EQ(r.sites[2].function, "delete");
    EXPECT_EQ(r.sites[3].function, "upload");
    EXPECT_EQ(r.sites[3].line, 9);
    EXPECT_EQ(r.sites[3].col, 1);
}

TEST(Scanner, StarImportOfSdkModule){
    auto r = scan("from infrar.storage import *\nlist_objects('b')\n");
    ASSERT_EQ(r.sites.size(), 1u);
    EXPECT_EQ(r.sites[0].function, "list_objects");
    EXPECT_EQ(r.sites[0].args.size(), 1u);
}

TEST(Scanner, StarImportOfOtherModuleHidesEarlierBinding){
    auto r = scan("from infrar.storage import upload\nfrom helpers import *\nupload('b', 's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    EXPECT_TRUE(r.skipped.empty());
}

TEST(Scanner, ShadowingAndMethodCallsAreNotMatched){
    auto r = scan(
        "from infrar.storage import upload\n"
        "\n"
        "def upload_local(upload):\n"
        "    upload('b', 's', 'd')\n"
        "\n"
        "def other():\n"
        "    def upload(*a):\n"
        "        pass\n"
        "    upload('b', 's', 'd')\n"
        "\n"
        "class Holder:\n"
        "    def upload(self, a, b, c):\n"
        "        pass\n"
        "    def run(self):\n"
        "        self.upload('b', 's', 'd')\n"
        "        upload('b', 's', 'd')\n"
        "\n"
        "obj.upload('b', 's', 'd')\n");
    ASSERT_EQ(r.sites.size(), 1u);
    EXPECT_EQ(r.sites[0].line, 16);
    EXPECT_TRUE(r.skipped.empty());
}

TEST(Scanner, FunctionLocalBindingAppliesToWholeBody){
    auto r = scan(
        "from infrar.storage import upload\n"
        "def g():\n"
        "    upload('b', 's', 'd')\n"
        "    upload = None\n"
        "def h():\n"
        "    global upload\n"
        "    upload('b', 's', 'd')\n");
    ASSERT_EQ(r.sites.size(), 1u);
    EXPECT_EQ(r.sites[0].line, 7);
}

TEST(Scanner, ConditionalBindingsWithDifferentTargetsAreAmbiguous){
    auto r = scan(
        "try:\n"
        "    from infrar.storage import upload\n"
        "except ImportError:\n"
        "    from backup import upload\n"
        "upload('b', 's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    ASSERT_EQ(r.skipped.size(), 1u);
    const Diagnostic& d = r.skipped[0];
    EXPECT_EQ(d.code, diag::AmbiguousBinding);
    EXPECT_EQ(d.line, 5);
    ASSERT_EQ(d.notes.size(), 2u);
    EXPECT_EQ(d.notes[0].line, 2);
    EXPECT_EQ(d.notes[1].line, 4);
}

TEST(Scanner, ConditionalRebindAfterImportIsAmbiguous){
    auto r = scan(
        "from infrar.storage import upload\n"
        "if local:\n"
        "    upload = None\n"
        "upload('b', 's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::AmbiguousBinding);
}

TEST(Scanner, OneLineCompoundImportIsConditional){
    auto r = scan(
        "from infrar.storage import upload\n"
        "if fast: from fastlib import upload\n"
        "upload('b', 's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::AmbiguousBinding);
    ASSERT_EQ(r.skipped[0].notes.size(), 2u);
    EXPECT_EQ(r.skipped[0].notes[1].line, 2);

    r = scan(
        "from infrar.storage import upload\n"
        "try: from fastlib import upload\n"
        "except ImportError: pass\n"
        "upload('b', 's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::AmbiguousBinding);
    EXPECT_EQ(r.skipped[0].line, 4);
}

TEST(Scanner, ComprehensionLambdaAndWalrusTargetsShadow){
    auto r = scan(
        "from infrar.storage import upload\n"
        "fns = [upload(b, s, d) for upload in handlers]\n"
        "g = lambda upload: upload('b', 's', 'd')\n"
        "h = lambda f: upload('b', 's', 'd')\n"
        "calls = [upload(x, 's', 'd') for x in buckets]\n");
    ASSERT_EQ(r.sites.size(), 2u);
    EXPECT_EQ(r.sites[0].line, 4);
    EXPECT_EQ(r.sites[1].line, 5);

    r = scan(
        "from infrar.storage import upload\n"
        "if (upload := pick()):\n"
        "    pass\n"
        "upload('b', 's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::AmbiguousBinding);
}

TEST(Scanner, ConditionalBindingsWithSameTargetMatch){
    auto r = scan(
        "if fast:\n"
        "    from infrar.storage import upload\n"
        "else:\n"
        "    from infrar.storage import upload\n"
        "upload('b', 's', 'd')\n");
    ASSERT_EQ(r.sites.size(), 1u);
    EXPECT_TRUE(r.skipped.empty());
}

TEST(Scanner, UnconditionalRebindReplacesImport){
    auto r = scan("from infrar.storage import upload\nupload = print\nupload('b', 's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    EXPECT_TRUE(r.skipped.empty());
}

TEST(Scanner, CallContexts){
    auto r = scan(
        "from infrar.storage import upload, list_objects\n"
        "upload('b', 's', 'd')\n"
        "x = list_objects('b')\n"
        "def f():\n"
        "    return list_objects('b')\n"
        "print(list_objects('b'))\n"
        "y = list_objects('b') or []\n");
    ASSERT_EQ(r.sites.size(), 5u);
    EXPECT_EQ(r.sites[0].context, CallContext::Statement);
    EXPECT_EQ(r.sites[1].context, CallContext::Assigned);
    EXPECT_EQ(r.sites[2].context, CallContext::Returned);
    EXPECT_EQ(r.sites[3].context, CallContext::Nested);
    EXPECT_EQ(r.sites[4].context, CallContext::Nested);
}

TEST(Scanner, ArgumentsKeepTextAndLiteralness){
    auto r = scan(
        "from infrar.storage import upload\n"
        "upload(cfg['bucket'],\n"
        "       source='a.csv',\n"
        "       destination=f'{day}/a.csv',)\n");
    ASSERT_EQ(r.sites.size(), 1u);
    const auto& args = r.sites[0].args;
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0].name, "");
    EXPECT_EQ(args[0].text, "cfg['bucket']");
    EXPECT_FALSE(args[0].literal);
    EXPECT_EQ(args[1].name, "source");
    EXPECT_EQ(args[1].text, "'a.csv'");
    EXPECT_TRUE(args[1].literal);
    EXPECT_EQ(args[2].line, 4);
    EXPECT_EQ(args[2].text, "f'{day}/a.csv'");
}

TEST(Scanner, StarArgumentsAreFlagged){
    auto r = scan("from infrar.storage import upload\nupload(*parts)\nupload('b', **opts)\n");
    ASSERT_EQ(r.sites.size(), 2u);
    EXPECT_TRUE(r.sites[0].args[0].star);
    EXPECT_TRUE(r.sites[1].args[1].double_star);
    EXPECT_EQ(r.sites[1].args[1].text, "opts");
}

TEST(Scanner, CommentInsideArgumentsIsSkipped){
    auto r = scan(
        "from infrar.storage import upload\n"
        "upload('b',  # bucket\n"
        "       's', 'd')\n");
    EXPECT_TRUE(r.sites.empty());
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::CommentInArguments);
    EXPECT_EQ(r.skipped[0].line, 2);
}

TEST(Scanner, NestedSdkCallsAreBothFound){
    auto r = scan("from infrar.storage import upload, download\nupload(download('b', 's', 'd'), 'x', 'y')\n");
    ASSERT_EQ(r.sites.size(), 2u);
    EXPECT_EQ(r.sites[0].function, "upload");
    EXPECT_EQ(r.sites[1].function, "download");
    EXPECT_EQ(r.sites[1].context, CallContext::Nested);
    EXPECT_LT(r.sites[0].begin, r.sites[1].begin);
    EXPECT_GT(r.sites[0].end, r.sites[1].end);
}

TEST(Scanner, ResolveReportsUnknownNames){
    SourceUnit u("import infrar.storage as st\nx = 1\n");
    Scanner s(u, rules());
    auto res = s.resolve({"st", "upload"}, 1);
    ASSERT_TRUE(std::holds_alternative<Matched>(res));
    EXPECT_EQ(std::get<Matched>(res).qualified, "infrar.storage.upload");
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(s.resolve({"st", "copy"}, 1)));
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(s.resolve({"upload"}, 1)));
}
