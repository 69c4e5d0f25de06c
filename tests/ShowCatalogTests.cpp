#include <gtest/gtest.h>

#include <string>

#include "core/catalog/CatalogLoader.h"
#include "tests/TestHelpers.h"

namespace {

using CatalogLoaderTest = testing_helpers::TempDirTest;

} // namespace

TEST_F(CatalogLoaderTest, LoadsShowsWithDefaults) {
  const auto path = writeFile("dictionary.json", R"({
    "1": {"id": 1, "title": "Alpha", "url": "https://example.org/1",
          "opening_themes": ["OP1", "OP2"], "ending_themes": ["ED1"]},
    "2": {"id": 2, "title": "Beta"}
  })");

  const ShowCatalog shows = catalog::loadCatalog(path);
  ASSERT_EQ(shows.size(), 2u);

  const Show& alpha = shows.at(1);
  EXPECT_EQ(alpha.title, "Alpha");
  ASSERT_TRUE(alpha.url.has_value());
  EXPECT_EQ(*alpha.url, "https://example.org/1");
  EXPECT_EQ(alpha.opening_themes, (std::vector<std::string>{"OP1", "OP2"}));
  EXPECT_EQ(alpha.ending_themes, (std::vector<std::string>{"ED1"}));
  EXPECT_TRUE(alpha.other_soundtrack.empty());

  const Show& beta = shows.at(2);
  EXPECT_FALSE(beta.url.has_value());
  EXPECT_TRUE(beta.opening_themes.empty());
  EXPECT_TRUE(beta.ending_themes.empty());
  EXPECT_TRUE(beta.other_soundtrack.empty());
}

TEST_F(CatalogLoaderTest, AcceptsFieldAliasesAndIgnoresUnknownFields) {
  const auto path = writeFile("dictionary.json", R"({
    "21": {"mal_id": 21, "title": "One Piece", "url": null, "score": 8.7,
           "soundtrack": ["Overtaken"], "ending_themes": null}
  })");

  const ShowCatalog shows = catalog::loadCatalog(path);
  ASSERT_EQ(shows.size(), 1u);
  const Show& show = shows.at(21);
  EXPECT_EQ(show.id, 21u);
  EXPECT_FALSE(show.url.has_value());
  EXPECT_EQ(show.other_soundtrack, (std::vector<std::string>{"Overtaken"}));
  EXPECT_TRUE(show.ending_themes.empty());
}

TEST_F(CatalogLoaderTest, PreservesDuplicateThemes) {
  const auto path = writeFile("dictionary.json", R"({
    "5": {"id": 5, "title": "Gamma", "opening_themes": ["A", "A"], "ending_themes": ["A"]}
  })");

  const ShowCatalog shows = catalog::loadCatalog(path);
  EXPECT_EQ(shows.at(5).opening_themes.size(), 2u);
  EXPECT_EQ(shows.at(5).ending_themes.size(), 1u);
}

TEST_F(CatalogLoaderTest, EmptyObjectYieldsEmptyCatalog) {
  const auto path = writeFile("dictionary.json", "{}");
  EXPECT_TRUE(catalog::loadCatalog(path).empty());
}

TEST_F(CatalogLoaderTest, RejectsMalformedDictionaries) {
  EXPECT_THROW(catalog::loadCatalog(dir_ / "missing.json"), CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("broken.json", "{\"1\": ")), CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("array.json", "[1, 2]")), CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("key.json", R"({"abc": {"id": 1, "title": "X"}})")),
               CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("negative-key.json", R"({"-1": {"id": 1, "title": "X"}})")),
               CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("no-title.json", R"({"1": {"id": 1}})")), CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("no-id.json", R"({"1": {"title": "X"}})")), CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("bad-id.json", R"({"1": {"id": -4, "title": "X"}})")),
               CatalogError);
  EXPECT_THROW(
      catalog::loadCatalog(writeFile("bad-themes.json", R"({"1": {"id": 1, "title": "X", "opening_themes": [3]}})")),
      CatalogError);
  EXPECT_THROW(catalog::loadCatalog(writeFile("both-ids.json", R"({"1": {"id": 1, "mal_id": 1, "title": "X"}})")),
               CatalogError);
}

TEST_F(CatalogLoaderTest, ErrorMessageNamesTheEntry) {
  const auto path = writeFile("dictionary.json", R"({"7": {"id": 7}})");
  try {
    catalog::loadCatalog(path);
    FAIL() << "expected CatalogError";
  } catch (const CatalogError& ex) {
    const std::string message = ex.what();
    EXPECT_NE(message.find("'7'"), std::string::npos);
    EXPECT_NE(message.find("title"), std::string::npos);
  }
}

TEST_F(CatalogLoaderTest, LoadsCandidateListInOrderWithDuplicates) {
  const auto path = writeFile("list.json", "[3, 1, 3, 0, 18446744073709551615]");
  const CandidateList ids = catalog::loadCandidateList(path);
  EXPECT_EQ(ids, (CandidateList{3, 1, 3, 0, 18446744073709551615ull}));
}

TEST_F(CatalogLoaderTest, RejectsMalformedCandidateLists) {
  EXPECT_THROW(catalog::loadCandidateList(dir_ / "missing.json"), CatalogError);
  EXPECT_THROW(catalog::loadCandidateList(writeFile("object.json", R"({"1": 1})")), CatalogError);
  EXPECT_THROW(catalog::loadCandidateList(writeFile("negative.json", "[1, -2]")), CatalogError);
  EXPECT_THROW(catalog::loadCandidateList(writeFile("float.json", "[1.5]")), CatalogError);
  EXPECT_THROW(catalog::loadCandidateList(writeFile("string.json", R"(["1"])")), CatalogError);
  EXPECT_TRUE(catalog::loadCandidateList(writeFile("empty.json", "[]")).empty());
}
