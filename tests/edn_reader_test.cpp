#include <gtest/gtest.h>
#include "infrar/edn.hpp"

using namespace infrar::edn;

TEST(EdnReader, MapWithKeywordsStringsAndVectors){
    auto n = parse("{:name \"upload\" :params [\"bucket\" :source], :no-capture true}");
    auto* m = as_map(*n);
    ASSERT_NE(m, nullptr);
    ASSERT_EQ(m->entries.size(), 3u);
    auto name = get(*m, "name");
    ASSERT_TRUE(name);
    EXPECT_EQ(*as_string(*name), "upload");
    auto params = get(*m, "params");
    ASSERT_TRUE(params);
    auto* seq = as_seq(*params);
    ASSERT_NE(seq, nullptr);
    ASSERT_EQ(seq->size(), 2u);
    EXPECT_EQ(*as_name(*(*seq)[0]), "bucket");
    EXPECT_EQ(*as_name(*(*seq)[1]), "source");
    auto nc = get(*m, "no-capture");
    ASSERT_TRUE(nc);
    EXPECT_TRUE(*as_bool(*nc));
    EXPECT_FALSE(get(*m, "missing"));
}

TEST(EdnReader, StringEscapesAndComments){
    auto n = parse(";; leading comment\n\"say \\\"hi\\\"\\n\"");
    ASSERT_NE(as_string(*n), nullptr);
    EXPECT_EQ(*as_string(*n), "say \"hi\"\n");
}

TEST(EdnReader, PositionsAreOneBased){
    auto n = parse("{:a\n  [1 2]}");
    auto v = get(*as_map(*n), "a");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->line, 2);
    EXPECT_EQ(v->col, 3);
}

TEST(EdnReader, NumbersAndNil){
    auto n = parse("[42 -7 2.5 nil]");
    auto* seq = as_seq(*n);
    ASSERT_NE(seq, nullptr);
    ASSERT_EQ(seq->size(), 4u);
    EXPECT_EQ(std::get<int64_t>((*seq)[0]->data), 42);
    EXPECT_EQ(std::get<int64_t>((*seq)[1]->data), -7);
    EXPECT_DOUBLE_EQ(std::get<double>((*seq)[2]->data), 2.5);
    EXPECT_TRUE(std::holds_alternative<std::monostate>((*seq)[3]->data));
}

TEST(EdnReader, MalformedInputThrows){
    EXPECT_THROW(parse("{:a \"unterminated}"), parse_error);
    EXPECT_THROW(parse("[1 2"), parse_error);
}
