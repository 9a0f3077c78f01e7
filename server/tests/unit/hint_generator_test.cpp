#include <gtest/gtest.h>

#include "doodle/hint_generator.hpp"

namespace {

TEST(HintGeneratorTest, MaskHidesLettersAndKeepsSpacing) {
  EXPECT_EQ(doodle::HintGenerator::BuildMask("cat", {}), "_ _ _");
  EXPECT_EQ(doodle::HintGenerator::BuildMask("cat", {1}), "_ a _");
  EXPECT_EQ(doodle::HintGenerator::BuildMask("ice cream", {}), "_ _ _   _ _ _ _ _");
}

TEST(HintGeneratorTest, MaxHintsIsCeilingOfThirdOfLetters) {
  EXPECT_EQ(doodle::HintGenerator::MaxHints("cat"), 1u);
  EXPECT_EQ(doodle::HintGenerator::MaxHints("apple"), 2u);
  EXPECT_EQ(doodle::HintGenerator::MaxHints("banana"), 2u);
  EXPECT_EQ(doodle::HintGenerator::MaxHints("ice cream"), 3u);
  EXPECT_EQ(doodle::HintGenerator::MaxHints(""), 0u);
}

TEST(HintGeneratorTest, RevealsAreSpreadOverHintWindow) {
  using doodle::HintGenerator;
  EXPECT_FALSE(HintGenerator::ShouldReveal(31, 30, 2, 0));
  EXPECT_TRUE(HintGenerator::ShouldReveal(30, 30, 2, 0));
  EXPECT_FALSE(HintGenerator::ShouldReveal(16, 30, 2, 1));
  EXPECT_TRUE(HintGenerator::ShouldReveal(15, 30, 2, 1));
  EXPECT_FALSE(HintGenerator::ShouldReveal(0, 30, 2, 2));
  EXPECT_FALSE(HintGenerator::ShouldReveal(0, 30, 0, 0));
}

TEST(HintGeneratorTest, RevealNextStopsAtBoundAndOnlyPicksLetters) {
  doodle::HintGenerator generator(11);
  std::set<std::size_t> revealed;
  const std::string word = "ice cream";
  int revealed_count = 0;
  while (generator.RevealNext(word, revealed)) {
    ++revealed_count;
  }
  EXPECT_EQ(revealed_count, 3);
  EXPECT_EQ(revealed.size(), 3u);
  EXPECT_EQ(revealed.count(3), 0u);
}

TEST(HintGeneratorTest, SameSeedRevealsSamePositions) {
  doodle::HintGenerator a(99);
  doodle::HintGenerator b(99);
  std::set<std::size_t> first;
  std::set<std::size_t> second;
  a.RevealNext("elephant", first);
  b.RevealNext("elephant", second);
  EXPECT_EQ(first, second);
}

}  // namespace
