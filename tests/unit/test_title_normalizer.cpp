#include <gtest/gtest.h>
#include "plexwatch/utils/title_normalizer.hpp"

using plexwatch::utils::TitleNormalizer;
using plexwatch::utils::normalize_title;
using plexwatch::utils::utf8_length;

TEST(TitleNormalizerTest, CutsAtFirstKeyword) {
    TitleNormalizer normalizer({"1080p", "BluRay"}, 40);
    EXPECT_EQ(normalizer.normalize("Movie.Name.2023.1080p.BluRay.x264"), "Movie Name 2023");
}

TEST(TitleNormalizerTest, KeywordMatchIsCaseInsensitive) {
    TitleNormalizer normalizer({"complete"}, 40);
    EXPECT_EQ(normalizer.normalize("Some Show S01 COMPLETE WEB"), "Some Show S01");
}

TEST(TitleNormalizerTest, KeywordMustStartAToken) {
    TitleNormalizer normalizer({"complete"}, 40);
    EXPECT_EQ(normalizer.normalize("Incomplete Story"), "Incomplete Story");
}

TEST(TitleNormalizerTest, KeywordAfterDashCuts) {
    TitleNormalizer normalizer({"GROUP"}, 40);
    EXPECT_EQ(normalizer.normalize("Title-GROUP"), "Title");
}

TEST(TitleNormalizerTest, TrimsSeparators) {
    TitleNormalizer normalizer({}, 40);
    EXPECT_EQ(normalizer.normalize("  __Title__  "), "Title");
    EXPECT_EQ(normalizer.normalize("A   B\tC"), "A B C");
}

TEST(TitleNormalizerTest, LongTitleGetsEllipsis) {
    TitleNormalizer normalizer({}, 5);
    EXPECT_EQ(normalizer.normalize("abcdefghij"), "abcde…");
}

TEST(TitleNormalizerTest, ExactLengthIsKept) {
    TitleNormalizer normalizer({}, 5);
    EXPECT_EQ(normalizer.normalize("abcde"), "abcde");
}

TEST(TitleNormalizerTest, LengthCountsCodePoints) {
    TitleNormalizer normalizer({}, 6);
    const auto result = normalizer.normalize("Amélie Poulain");
    EXPECT_EQ(result, "Amélie…");
    EXPECT_EQ(utf8_length(result), 7u);
}

TEST(TitleNormalizerTest, EmptyInput) {
    EXPECT_EQ(normalize_title("", {"x"}, 10), "");
    EXPECT_EQ(normalize_title("...", {}, 10), "");
}

TEST(TitleNormalizerTest, NormalizingTwiceChangesNothing) {
    const std::vector<std::string> keywords = {"2160p", "REPACK"};
    const std::vector<std::string> inputs = {
        "The.Long.Movie.Title.Goes.Here.2160p.REPACK",
        "Short",
        "A.Very.Long.Release.Name.That.Does.Not.Stop.Anywhere.Soon",
        "Name -",
    };
    for (const auto& input : inputs) {
        const auto once = normalize_title(input, keywords, 20);
        EXPECT_EQ(normalize_title(once, keywords, 20), once) << input;
    }
}

TEST(TitleNormalizerTest, ReleaseNameWithLanguageAndResolution) {
    EXPECT_EQ(normalize_title("Movie.Name.German.1080p.mkv", {"German", "1080p"}, 40), "Movie Name");
}

TEST(TitleNormalizerTest, KeywordAtStartGivesEmptyTitle) {
    EXPECT_EQ(normalize_title("1080p.Something", {"1080p"}, 40), "");
}
