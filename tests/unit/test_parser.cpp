#include <gtest/gtest.h>
#include "parser/dictionary.hpp"
#include "parser/triple_reader.hpp"

using namespace isum;

// ==========================================
// Dictionary Tests
// ==========================================

TEST(DictionaryTest, DenseIdsInOrderOfAppearance) {
    Dictionary dict;
    EXPECT_EQ(dict.get_or_insert("<a>"), 0);
    EXPECT_EQ(dict.get_or_insert("<p>"), 1);
    EXPECT_EQ(dict.get_or_insert("<a>"), 0);
    EXPECT_EQ(dict.get_or_insert("<b>"), 2);

    EXPECT_EQ(dict.size(), 3);
    EXPECT_EQ(dict.next_id(), 3);
    EXPECT_EQ(dict.id_of("<p>"), std::optional<NodeId>(1));
    EXPECT_EQ(dict.term_of(2), std::optional<std::string>("<b>"));
    EXPECT_FALSE(dict.id_of("<z>").has_value());
    EXPECT_FALSE(dict.term_of(7).has_value());
}

TEST(DictionaryTest, ReserveThrough) {
    Dictionary dict;
    dict.get_or_insert("<a>");
    dict.reserve_through(99);
    EXPECT_EQ(dict.get_or_insert("<b>"), 100);

    // Never moves backwards
    dict.reserve_through(5);
    EXPECT_EQ(dict.get_or_insert("<c>"), 101);
}

TEST(DictionaryTest, JsonRoundTrip) {
    Dictionary dict;
    dict.get_or_insert("<a>");
    dict.get_or_insert("\"some literal\"");
    dict.reserve_through(10);

    Dictionary restored = Dictionary::from_json(dict.to_json());
    EXPECT_EQ(restored.size(), 2);
    EXPECT_EQ(restored.id_of("\"some literal\""), std::optional<NodeId>(1));
    EXPECT_EQ(restored.next_id(), 11);
}

TEST(DictionaryTest, FromJsonRejectsDuplicates) {
    auto j = nlohmann::json::parse(R"({"terms": [{"id": 0, "term": "<a>"}, {"id": 1, "term": "<a>"}]})");
    EXPECT_THROW(Dictionary::from_json(j), std::runtime_error);
}

TEST(DictionaryTest, FromJsonRejectsIdsBeyondNodeRange) {
    auto too_wide = nlohmann::json::parse(R"({"terms": [{"id": 4294967298, "term": "<a>"}]})");
    EXPECT_THROW(Dictionary::from_json(too_wide), std::runtime_error);

    auto wide_next = nlohmann::json::parse(R"({"next_id": 4294967296, "terms": []})");
    EXPECT_THROW(Dictionary::from_json(wide_next), std::runtime_error);

    auto negative = nlohmann::json::parse(R"({"terms": [{"id": -1, "term": "<a>"}]})");
    EXPECT_THROW(Dictionary::from_json(negative), std::runtime_error);
}

TEST(DictionaryTest, LastIdCannotBeReserved) {
    Dictionary dict;
    EXPECT_THROW(dict.reserve_through(0xFFFFFFFF), std::runtime_error);

    dict.reserve_through(0xFFFFFFFE);
    EXPECT_THROW(dict.get_or_insert("<a>"), std::runtime_error);
}

// ==========================================
// Statement Tests
// ==========================================

TEST(StatementTest, ParseIris) {
    auto statement = parse_statement("<http://x/a> <http://x/p> <http://x/b> .");
    ASSERT_TRUE(statement.has_value());
    EXPECT_EQ(statement->subject, "<http://x/a>");
    EXPECT_EQ(statement->predicate, "<http://x/p>");
    EXPECT_EQ(statement->object, "<http://x/b>");
}

TEST(StatementTest, ParseLiteralWithSpaces) {
    auto statement = parse_statement("_:b1 <p> \"hello world\"@en .");
    ASSERT_TRUE(statement.has_value());
    EXPECT_EQ(statement->subject, "_:b1");
    EXPECT_EQ(statement->object, "\"hello world\"@en");

    auto typed = parse_statement("<a> <p> \"4\"^^<http://www.w3.org/2001/XMLSchema#int>");
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->object, "\"4\"^^<http://www.w3.org/2001/XMLSchema#int>");

    auto escaped = parse_statement(R"(<a> <p> "say \"hi\"" .)");
    ASSERT_TRUE(escaped.has_value());
    EXPECT_EQ(escaped->object, R"("say \"hi\"")");
}

TEST(StatementTest, BlankAndCommentLines) {
    EXPECT_FALSE(parse_statement("").has_value());
    EXPECT_FALSE(parse_statement("   ").has_value());
    EXPECT_FALSE(parse_statement("# comment").has_value());
    EXPECT_TRUE(parse_statement("<a> <p> <b> . # trailing").has_value());
}

TEST(StatementTest, MalformedLines) {
    EXPECT_THROW(parse_statement("<a> <p> ."), std::runtime_error);
    EXPECT_THROW(parse_statement("<a> <p"), std::runtime_error);
    EXPECT_THROW(parse_statement("<a> <p> \"open"), std::runtime_error);
    EXPECT_THROW(parse_statement("<a> <p> <b> <c> ."), std::runtime_error);
}

// ==========================================
// File Content Tests
// ==========================================

TEST(FactLinesTest, EncodesThroughDictionary) {
    Dictionary dict;
    auto triples = parse_fact_lines({
        "<a> <p> <b> .",
        "",
        "<a> <p> <c> .",
        "# done"
    }, dict);

    ASSERT_EQ(triples.size(), 2);
    EXPECT_EQ(triples[0], Triple(0, 1, 2));
    EXPECT_EQ(triples[1], Triple(0, 1, 3));
}

TEST(FactLinesTest, ErrorNamesSourceAndLine) {
    Dictionary dict;
    try {
        parse_fact_lines({"<a> <p> <b> .", "<a> <p>"}, dict, "facts.nt");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("facts.nt:2"), std::string::npos);
    }
}

TEST(UpdateLinesTest, SplitsAdditionsAndDeletions) {
    Dictionary dict;
    dict.get_or_insert("<a>");
    dict.get_or_insert("<p>");
    dict.get_or_insert("<b>");

    UpdateSet updates = parse_update_lines({
        "- <a> <p> <b> .",
        "+ <a> <p> <c> .",
        "  # comment",
        "+<c> <p> <b> ."
    }, dict);

    ASSERT_EQ(updates.deletions.size(), 1);
    ASSERT_EQ(updates.additions.size(), 2);
    EXPECT_EQ(updates.deletions[0], Triple(0, 1, 2));
    EXPECT_EQ(updates.additions[0], Triple(0, 1, 3));
    EXPECT_EQ(updates.additions[1], Triple(3, 1, 2));
    EXPECT_FALSE(updates.empty());
}

TEST(UpdateLinesTest, RejectsBadLines) {
    Dictionary dict;
    EXPECT_THROW(parse_update_lines({"<a> <p> <b> ."}, dict), std::runtime_error);
    EXPECT_THROW(parse_update_lines({"+"}, dict), std::runtime_error);
    EXPECT_THROW(parse_update_lines({"- <a> <p>"}, dict), std::runtime_error);
}

TEST(ReadLinesTest, MissingFileThrows) {
    EXPECT_THROW(read_lines("no_such_file.nt"), std::runtime_error);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
