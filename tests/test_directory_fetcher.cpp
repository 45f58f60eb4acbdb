#include <gtest/gtest.h>
#include <catalog/fetcher.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class DirectoryFetcherTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "termplan_fetcher_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel_path, const std::string& content) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }
};

TEST_F(DirectoryFetcherTest, ReadsBareList) {
    write_file("202608/dept/CMSC.yaml",
               "- code: CMSC131\n"
               "  section: \"0101\"\n"
               "  credits: 4\n"
               "  days: MWF\n"
               "  time: 10:00am-10:50am\n"
               "- code: CMSC132\n"
               "  section: \"0201\"\n"
               "  credits: 4\n");

    DirectoryCatalogFetcher fetcher(test_dir);
    auto result = fetcher.fetch({PartitionKind::Department, "CMSC", "202608"});
    ASSERT_TRUE(result.is_ok()) << result.error;
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[0].code, "CMSC131");
    EXPECT_EQ(result.value[0].section, "0101");
    EXPECT_EQ(result.value[0].term_id, "202608");
    EXPECT_EQ(result.value[1].code, "CMSC132");
}

TEST_F(DirectoryFetcherTest, ReadsSectionsMapping) {
    write_file("202608/gened/FSOC.yaml",
               "sections:\n"
               "  - code: COMM107\n"
               "    section: \"0101\"\n"
               "    credits: 3\n"
               "    gen_eds: [FSOC]\n");

    DirectoryCatalogFetcher fetcher(test_dir);
    auto result = fetcher.fetch({PartitionKind::GenEd, "FSOC", "202608"});
    ASSERT_TRUE(result.is_ok()) << result.error;
    ASSERT_EQ(result.value.size(), 1u);
    EXPECT_EQ(result.value[0].gen_eds.count("FSOC"), 1u);
}

TEST_F(DirectoryFetcherTest, MissingFileIsError) {
    DirectoryCatalogFetcher fetcher(test_dir);
    auto result = fetcher.fetch({PartitionKind::Department, "MATH", "202608"});
    EXPECT_TRUE(result.is_err());
}

TEST_F(DirectoryFetcherTest, UnknownGenEdIsError) {
    DirectoryCatalogFetcher fetcher(test_dir);
    auto result = fetcher.fetch({PartitionKind::GenEd, "XXXX", "202608"});
    EXPECT_TRUE(result.is_err());
}

TEST_F(DirectoryFetcherTest, NonPositiveCreditsIsError) {
    write_file("202608/dept/MATH.yaml", "- code: MATH140\n  credits: 0\n");
    DirectoryCatalogFetcher fetcher(test_dir);
    auto result = fetcher.fetch({PartitionKind::Department, "MATH", "202608"});
    EXPECT_TRUE(result.is_err());
}

TEST_F(DirectoryFetcherTest, AsFetchFn) {
    write_file("202608/dept/HIST.yaml", "- code: HIST200\n  credits: 3\n  open_seats: -4\n");
    DirectoryCatalogFetcher fetcher(test_dir);
    FetchFn fn = fetcher.as_fetch_fn();
    auto result = fn({PartitionKind::Department, "HIST", "202608"});
    ASSERT_TRUE(result.is_ok()) << result.error;
    ASSERT_EQ(result.value.size(), 1u);
    EXPECT_EQ(result.value[0].open_seats, 0);
}
