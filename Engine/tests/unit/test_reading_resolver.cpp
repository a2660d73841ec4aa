/**
 * @file test_reading_resolver.cpp
 * @brief Unit tests for dictionary-based reading resolution
 */

#include "../test_support.hpp"
#include <annotation/reading_resolver.hpp>
#include <annotation/word_grammar.hpp>
#include <memory>

using namespace Rosetta;

namespace {

std::shared_ptr<const Dictionary> sample_dictionary() {
    return std::make_shared<MemoryDictionary>(MemoryDictionary{
        {"英語", {"えいご"}},
        {"誰", {"かれ", "だれ"}},
        {"食う", {"くう", "くう"}},
        {"は", {"は"}},
        {"上手", {"じょうず", "うわて", "かみて"}},
    });
}

WordToken token(const std::string& text) {
    return *WordGrammarParser::parse_word(text);
}

} // namespace

TEST(ReadingResolverTest, SingleReadingIsFilled) {
    ReadingResolver resolver(sample_dictionary());
    WordSequence s{token("英語")};
    resolver.resolve(s);
    EXPECT_EQ(s[0].reading, "えいご");
}

TEST(ReadingResolverTest, SenseSelectsReading) {
    ReadingResolver resolver(sample_dictionary());
    WordSequence s{token("誰[2]")};
    resolver.resolve(s);
    EXPECT_EQ(s[0].reading, "だれ");
}

TEST(ReadingResolverTest, OutOfRangeSenseWithMixedReadings) {
    ReadingResolver resolver(sample_dictionary());
    WordSequence s{token("誰[5]"), token("上手[0]"), token("誰")};
    resolver.resolve(s);
    EXPECT_FALSE(s[0].reading.has_value());
    EXPECT_FALSE(s[1].reading.has_value());
    EXPECT_FALSE(s[2].reading.has_value());
}

TEST(ReadingResolverTest, OutOfRangeSenseWithUniformReadings) {
    ReadingResolver resolver(sample_dictionary());
    WordSequence s{token("食う[07]")};
    resolver.resolve(s);
    EXPECT_EQ(s[0].reading, "くう");
    EXPECT_EQ(s[0].sense, 7);
}

TEST(ReadingResolverTest, ReadingEqualToHeadwordIsNotStored) {
    ReadingResolver resolver(sample_dictionary());
    WordSequence s{token("は")};
    resolver.resolve(s);
    EXPECT_FALSE(s[0].reading.has_value());
}

TEST(ReadingResolverTest, ExistingReadingIsKept) {
    ReadingResolver resolver(sample_dictionary());
    WordSequence s{token("英語(えーご)")};
    resolver.resolve(s);
    EXPECT_EQ(s[0].reading, "えーご");
}

TEST(ReadingResolverTest, UnknownHeadwordUnchanged) {
    ReadingResolver resolver(sample_dictionary());
    WordSequence s{token("数学")};
    resolver.resolve(s);
    EXPECT_FALSE(s[0].reading.has_value());
}

TEST(ReadingResolverTest, NoDictionaryPassesThrough) {
    ReadingResolver resolver;
    EXPECT_FALSE(resolver.has_dictionary());

    WordSequence s{token("英語"), token("誰[2]")};
    WordSequence before = s;
    resolver.resolve(s);
    EXPECT_EQ(s, before);
}

TEST(MemoryDictionaryTest, AddAppendsReadings) {
    MemoryDictionary dict;
    dict.add("行く", {"いく"});
    dict.add("行く", {"ゆく"});

    auto entry = dict.lookup("行く");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->readings, (std::vector<std::string>{"いく", "ゆく"}));
    EXPECT_EQ(dict.size(), 1u);
    EXPECT_FALSE(dict.lookup("来る").has_value());
}
