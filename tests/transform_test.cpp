#include <gtest/gtest.h>
#include "infrar/driver.hpp"
#include "infrar/errors.hpp"

using namespace infrar;

namespace {

const RuleRepository& rules(){
    static const RuleRepository repo = RuleRepository::builtin();
    return repo;
}

TransformResult run(const std::string& src, Provider p = Provider::Aws, TransformOptions opts = {}){
    return transform(src, p, rules(), opts);
}

const char* kAzureBlock =
    "import os\n"
    "from azure.storage.blob import BlobServiceClient\n"
    "blob_service_client = BlobServiceClient.from_connection_string(os.environ['AZURE_STORAGE_CONNECTION_STRING'])\n";

}

TEST(Transform, AwsUploadEndToEnd){
    auto r = run("from infrar.storage import upload\n\nupload(bucket='data', source='file.csv', destination='backup.csv')\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\n\ns3.upload_file('file.csv', 'data', 'backup.csv')\n");
    EXPECT_EQ(r.state, RewriteState::Finalized);
    ASSERT_EQ(r.transformed.size(), 1u);
    EXPECT_EQ(r.transformed[0].line, 3);
    EXPECT_EQ(r.inserted_imports, std::vector<std::string>{"import boto3"});
    EXPECT_EQ(r.inserted_setup, std::vector<std::string>{"s3 = boto3.client('s3')"});
    EXPECT_EQ(r.pruned_imports, std::vector<std::string>{"from infrar.storage import upload"});
    EXPECT_TRUE(r.skipped.empty());
}

TEST(Transform, GcpSetupIsInsertedOnce){
    auto r = run("from infrar.storage import upload\nupload('a', 'x.csv', 'y.csv')\nupload('b', 'z.csv', 'w.csv')\n", Provider::Gcp);
    EXPECT_EQ(r.output,
              "from google.cloud import storage\n"
              "storage_client = storage.Client()\n"
              "storage_client.bucket('a').blob('y.csv').upload_from_filename('x.csv')\n"
              "storage_client.bucket('b').blob('w.csv').upload_from_filename('z.csv')\n");
    EXPECT_EQ(r.transformed.size(), 2u);
}

TEST(Transform, AzureDeleteThroughModuleAlias){
    auto r = run("import infrar.storage as st\n\ndef clean(b):\n    st.delete(b, path='tmp/x')\n", Provider::Azure);
    EXPECT_EQ(r.output, std::string(kAzureBlock) +
              "\ndef clean(b):\n    blob_service_client.get_blob_client(container=b, blob='tmp/x').delete_blob()\n");
    EXPECT_EQ(r.pruned_imports, std::vector<std::string>{"import infrar.storage as st"});
}

TEST(Transform, DefaultArgumentIsFilledIn){
    auto r = run("from infrar.storage import list_objects\nlist_objects('data')\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.list_objects_v2(Bucket='data', Prefix=\"\")\n");
}

TEST(Transform, AwsDeleteUsesMappedPlaceholder){
    auto r = run("from infrar.storage import delete\ndelete('logs', path)\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.delete_object(Bucket='logs', Key=path)\n");
}

TEST(Transform, SkippedSitesLeaveTextUntouched){
    const std::string commented = "from infrar.storage import upload\nupload('b',  # bucket\n       's', 'd')\n";
    auto r = run(commented);
    EXPECT_EQ(r.output, commented);
    EXPECT_EQ(r.state, RewriteState::Unmodified);
    EXPECT_FALSE(r.changed());
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::CommentInArguments);

    const std::string captured = "from infrar.storage import list_objects\nx = list_objects('b')\n";
    r = run(captured, Provider::Gcp);
    EXPECT_EQ(r.output, captured);
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::CaptureUnsupported);
}

TEST(Transform, MixedRewriteAndSkipKeepsUsedImport){
    auto r = run("from infrar.storage import upload, list_objects\nupload('b', 's', 'd')\nitems = list_objects('b')\n");
    EXPECT_EQ(r.output,
              "from infrar.storage import list_objects\n"
              "import boto3\n"
              "s3 = boto3.client('s3')\n"
              "s3.upload_file('s', 'b', 'd')\n"
              "items = list_objects('b')\n");
    EXPECT_EQ(r.state, RewriteState::Finalized);
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].line, 3);
}

TEST(Transform, PartialImportPruning){
    auto r = run(
        "from infrar.storage import upload, StorageError\n"
        "\n"
        "try:\n"
        "    upload('b', 's', 'd')\n"
        "except StorageError:\n"
        "    pass\n");
    EXPECT_EQ(r.output,
              "from infrar.storage import StorageError\n"
              "import boto3\n"
              "s3 = boto3.client('s3')\n"
              "\n"
              "try:\n"
              "    s3.upload_file('s', 'b', 'd')\n"
              "except StorageError:\n"
              "    pass\n");

    r = run("from infrar.storage import download, upload\nupload('b', 's', 'd')\n");
    EXPECT_EQ(r.output, "from infrar.storage import download\nimport boto3\ns3 = boto3.client('s3')\ns3.upload_file('s', 'b', 'd')\n");
}

TEST(Transform, PruningCanBeDisabled){
    TransformOptions opts;
    opts.prune_imports = false;
    auto r = run("from infrar.storage import upload\nupload('b', 's', 'd')\n", Provider::Aws, opts);
    EXPECT_EQ(r.output, "from infrar.storage import upload\nimport boto3\ns3 = boto3.client('s3')\ns3.upload_file('s', 'b', 'd')\n");
    EXPECT_TRUE(r.pruned_imports.empty());
}

TEST(Transform, BlockGoesAfterDocstringWhenNoTopLevelImport){
    auto r = run(
        "\"\"\"Backup job.\"\"\"\n"
        "\n"
        "def run():\n"
        "    from infrar.storage import upload\n"
        "    upload('b', 's', 'd')\n");
    EXPECT_EQ(r.output,
              "\"\"\"Backup job.\"\"\"\n"
              "import boto3\n"
              "s3 = boto3.client('s3')\n"
              "\n"
              "def run():\n"
              "    from infrar.storage import upload\n"
              "    s3.upload_file('s', 'b', 'd')\n");
}

TEST(Transform, ExistingImportsAndSetupAreReused){
    auto r = run("import boto3\nfrom infrar.storage import upload\nupload('b', 's', 'd')\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.upload_file('s', 'b', 'd')\n");
    EXPECT_TRUE(r.inserted_imports.empty());
    EXPECT_EQ(r.inserted_setup.size(), 1u);

    r = run("import boto3\ns3 = boto3.client('s3')\nfrom infrar.storage import upload\nupload('b', 's', 'd')\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.upload_file('s', 'b', 'd')\n");
    EXPECT_TRUE(r.inserted_setup.empty());
}

TEST(Transform, LaterCopiesOfImportAndSetupMoveIntoTheBlock){
    auto r = run("from infrar.storage import upload\nupload('b', 's', 'd')\nimport boto3\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.upload_file('s', 'b', 'd')\n");
    EXPECT_EQ(r.inserted_imports, std::vector<std::string>{"import boto3"});

    r = run("from infrar.storage import upload\nupload('b', 's', 'd')\ns3 = boto3.client('s3')\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.upload_file('s', 'b', 'd')\n");
    EXPECT_EQ(r.inserted_setup.size(), 1u);
}

TEST(Transform, BlockThatWouldRebindALiveNameLeavesTheFileAlone){
    const std::string gcp =
        "from infrar import storage\n"
        "storage.upload('b', 's', 'd')\n"
        "items = storage.list_objects('b')\n";
    auto r = run(gcp, Provider::Gcp);
    EXPECT_EQ(r.output, gcp);
    EXPECT_EQ(r.state, RewriteState::Unmodified);
    EXPECT_TRUE(r.transformed.empty());
    EXPECT_TRUE(r.inserted_imports.empty());
    ASSERT_EQ(r.skipped.size(), 2u);
    EXPECT_EQ(r.skipped[0].code, diag::NameCollision);
    EXPECT_EQ(r.skipped[0].line, 2);
    ASSERT_EQ(r.skipped[0].notes.size(), 1u);
    EXPECT_EQ(r.skipped[0].notes[0].line, 1);
    EXPECT_EQ(r.skipped[1].code, diag::CaptureUnsupported);
    EXPECT_EQ(r.skipped[1].line, 3);

    const std::string aws = "from infrar.storage import upload\ns3 = make_client()\nupload('b', 's', 'd')\n";
    r = run(aws);
    EXPECT_EQ(r.output, aws);
    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].code, diag::NameCollision);
    EXPECT_EQ(r.skipped[0].line, 3);
    EXPECT_EQ(r.skipped[0].notes[0].line, 2);
}

TEST(Transform, FullyRewrittenSdkAliasMayBeRebound){
    const std::string src = "from infrar import storage\nstorage.upload('b', 's', 'd')\n";
    const std::string native =
        "from google.cloud import storage\n"
        "storage_client = storage.Client()\n"
        "storage_client.bucket('b').blob('d').upload_from_filename('s')\n";
    auto r = run(src, Provider::Gcp);
    EXPECT_EQ(r.output, native);
    EXPECT_TRUE(r.skipped.empty());

    TransformOptions opts;
    opts.prune_imports = false;
    r = run(src, Provider::Gcp, opts);
    EXPECT_EQ(r.output, "from infrar import storage\n" + native);
}

TEST(Transform, CrlfLineEndingsArePreserved){
    auto r = run("from infrar.storage import upload\r\nupload('b', 's', 'd')\r\n");
    EXPECT_EQ(r.output, "import boto3\r\ns3 = boto3.client('s3')\r\ns3.upload_file('s', 'b', 'd')\r\n");
}

TEST(Transform, NestedSdkCallIsSplicedIntoOuterCall){
    auto r = run("from infrar.storage import upload, download\nupload(download('b', 's', 'd'), 'x', 'y')\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.upload_file('x', s3.download_file('b', 's', 'd'), 'y')\n");
    EXPECT_EQ(r.transformed.size(), 2u);
}

TEST(Transform, MultiLineCallWithTrailingComma){
    auto r = run("from infrar.storage import upload\nupload(\n    'b',\n    's',\n    'd',\n)\n");
    EXPECT_EQ(r.output, "import boto3\ns3 = boto3.client('s3')\ns3.upload_file('s', 'b', 'd')\n");
}

TEST(Transform, UnrelatedCodeIsByteIdentical){
    const std::string src = "import os\n\n# keep   spacing\nx = os.path.join( 'a' , 'b' )\nupload('b', 's', 'd')\n";
    auto r = run(src);
    EXPECT_EQ(r.output, src);
    EXPECT_EQ(r.state, RewriteState::Unmodified);
    EXPECT_TRUE(r.transformed.empty());
}

TEST(Transform, SecondRunIsANoOp){
    for(auto p : all_providers){
        auto first = run("from infrar.storage import upload, delete\nupload('b', 's', 'd')\ndelete('b', 'p')\n", p);
        ASSERT_TRUE(first.changed());
        auto second = run(first.output, p);
        EXPECT_EQ(second.output, first.output) << to_string(p);
        EXPECT_FALSE(second.changed());
    }
}

TEST(Transform, MissingRuleAbortsTheRun){
    auto repo = RuleRepository::load(
        "{:version 1"
        " :signatures [{:module \"infrar.storage\" :name \"upload\" :params [\"bucket\" \"source\" \"destination\"]}]"
        " :rules [{:function \"upload\" :provider :aws :imports [\"boto3\"] :setup [\"s3 = boto3.client('s3')\"]"
        "          :template \"s3.upload_file({source}, {bucket}, {destination})\"}]}");
    const std::string src = "from infrar.storage import upload\nupload('b', 's', 'd')\n";
    EXPECT_NO_THROW(transform(src, Provider::Aws, repo));
    EXPECT_THROW(transform(src, Provider::Gcp, repo), missing_rule_error);
    EXPECT_NO_THROW(transform("x = 1\n", Provider::Gcp, repo));
}

TEST(Transform, MalformedSourceThrowsParseError){
    EXPECT_THROW(run("x = (1,\n"), parse_error);
}

TEST(Transform, EveryRuleKeepsLiteralsAndImportsOnce){
    auto count = [](const std::string& hay, const std::string& needle){
        std::size_t n = 0;
        for(auto p = hay.find(needle); p!=std::string::npos; p = hay.find(needle, p + 1)) ++n;
        return n;
    };
    for(auto p : all_providers){
        for(const auto& sig : rules().signatures()){
            std::string call = sig.name + "(";
            for(std::size_t i=0; i<sig.params.size(); ++i) call += (i ? ", '" : "'") + sig.params[i].name + "_lit'";
            call += ")\n";
            auto r = run("from infrar.storage import " + sig.name + "\n" + call + call, p);
            const std::string where = sig.name + "/" + to_string(p);
            ASSERT_EQ(r.transformed.size(), 2u) << where;
            for(const auto& par : sig.params) EXPECT_EQ(count(r.output, "'" + par.name + "_lit'"), 2u) << where;
            const TransformRule* rule = rules().lookup(sig.name, p);
            for(const auto& req : rule->imports) EXPECT_EQ(count(r.output, req.statement() + "\n"), 1u) << where;
            for(const auto& s : rule->setup) EXPECT_EQ(count(r.output, s), 1u) << where;
            EXPECT_EQ(r.output.find("infrar.storage"), std::string::npos) << where;
        }
    }
}

TEST(Transform, ZeroRecognizedCallsRoundTripForEveryProvider){
    const std::string src = "#!/usr/bin/env python3\n\"\"\"Doc.\"\"\"\nfrom storage_lib import upload\nupload('b', 's', 'd')\r\n";
    for(auto p : all_providers){
        auto r = run(src, p);
        EXPECT_EQ(r.output, src);
        EXPECT_EQ(r.state, RewriteState::Unmodified);
    }
}
