#include <gtest/gtest.h>
#include "sheetdrop/server/FileStorage.hpp"
#include "test_support.hpp"

using sheetdrop::FileStorage;
using namespace sheetdrop::test;

TEST(FileStorageTest, SanitizeKeepsOrdinaryNames) {
    EXPECT_EQ(FileStorage::sanitizeFilename("sales 2024 (final).xlsx"), "sales 2024 (final).xlsx");
    EXPECT_EQ(FileStorage::sanitizeFilename("data_v2-1.csv"), "data_v2-1.csv");
    EXPECT_EQ(FileStorage::sanitizeFilename("\xE9\x94\x80\xE5\x94\xAE.xlsx"), "\xE9\x94\x80\xE5\x94\xAE.xlsx");
}

TEST(FileStorageTest, SanitizeStripsDirectoriesAndTraversal) {
    EXPECT_EQ(FileStorage::sanitizeFilename("../../etc/passwd"), "passwd");
    EXPECT_EQ(FileStorage::sanitizeFilename("C:\\Users\\me\\book.xlsx"), "book.xlsx");
    EXPECT_EQ(FileStorage::sanitizeFilename(".."), "uploaded_file.xlsx");
    EXPECT_EQ(FileStorage::sanitizeFilename("dir/"), "uploaded_file.xlsx");
    EXPECT_EQ(FileStorage::sanitizeFilename(".hidden"), "hidden");
}

TEST(FileStorageTest, SanitizeReplacesUnsafeCharacters) {
    EXPECT_EQ(FileStorage::sanitizeFilename("a*b?c|d.xlsx"), "a_b_c_d.xlsx");
    EXPECT_EQ(FileStorage::sanitizeFilename(std::string("x\0y.xlsx", 8)), "x_y.xlsx");
}

TEST(FileStorageTest, ReservedNames) {
    EXPECT_TRUE(FileStorage::isReserved("analysis_results.json"));
    EXPECT_TRUE(FileStorage::isReserved("settings.json"));
    EXPECT_TRUE(FileStorage::isReserved("history"));
    EXPECT_FALSE(FileStorage::isReserved("report.xlsx"));
}

TEST(FileStorageTest, SaveOverwritesExistingFile) {
    TempDir dir;
    FileStorage storage(dir.path().string());

    auto first = storage.saveFile("book.xlsx", {'l', 'o', 'n', 'g', 'e', 'r'});
    auto second = storage.saveFile("book.xlsx", {'s', 'h'});

    EXPECT_EQ(first, second);
    EXPECT_TRUE(first.is_absolute());
    EXPECT_EQ(readFile(dir / "book.xlsx"), "sh");
    EXPECT_EQ(storage.readFile("book.xlsx"), "sh");
}

TEST(FileStorageTest, CopyAndReadErrors) {
    TempDir dir;
    FileStorage storage(dir.path().string());
    writeFile(dir / "a.json", "{\"k\":1}");
    storage.ensureDirectory("history");

    storage.copyFile("a.json", "history/b.json");
    EXPECT_EQ(readFile(dir / "history" / "b.json"), "{\"k\":1}");

    EXPECT_THROW(storage.readFile("missing.json"), std::runtime_error);
    EXPECT_THROW(storage.copyFile("missing.json", "history/c.json"), std::runtime_error);
    EXPECT_FALSE(storage.exists("history/c.json"));
}

TEST(FileStorageTest, CreatesRootOnConstruction) {
    TempDir dir;
    FileStorage storage((dir / "nested" / "root").string());
    EXPECT_TRUE(std::filesystem::is_directory(dir / "nested" / "root"));
    EXPECT_EQ(storage.root(), std::filesystem::absolute(dir / "nested" / "root").lexically_normal());
}
