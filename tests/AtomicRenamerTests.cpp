#include <gtest/gtest.h>

#include <vector>

#include "../AtomicRenamer.hpp"
#include "../IOManager.hpp"
#include "TestHelpers.hpp"

class AtomicRenamerTest : public TempDirTest {
 protected:
  PhotoRecord WithNewName(const std::string& name, const std::string& newName,
                          const fs::path& dir) {
    PhotoRecord rec = MakeRecord(name, 60.0, 24.0, std::nullopt, dir);
    rec.new_name = newName;
    return rec;
  }
};

// a and b want each other's names; the two-phase shuffle must keep both.
TEST_F(AtomicRenamerTest, InPlaceSwapKeepsEveryPhoto) {
  CreateFile("a.jpg", "content of a");
  CreateFile("b.jpg", "content of b");

  std::vector<PhotoRecord> records = {
      WithNewName("a.jpg", "b.jpg", test_dir),
      WithNewName("b.jpg", "a.jpg", test_dir),
  };
  const auto journal = AtomicRenamer::apply(records, test_dir, false);

  EXPECT_EQ(journal.size(), 2u);
  EXPECT_EQ(ReadFile(test_dir / "b.jpg"), "content of a");
  EXPECT_EQ(ReadFile(test_dir / "a.jpg"), "content of b");
  EXPECT_EQ(records[0].source_path, test_dir / "b.jpg");
  EXPECT_EQ(records[1].source_path, test_dir / "a.jpg");
  EXPECT_EQ(ListNames(test_dir), (std::vector<std::string>{"a.jpg", "b.jpg"}));
}

TEST_F(AtomicRenamerTest, InPlaceCycleLeavesNoTemporaryFiles) {
  CreateFile("1.jpg");
  CreateFile("2.jpg");
  CreateFile("3.jpg");

  std::vector<PhotoRecord> records = {
      WithNewName("1.jpg", "2.jpg", test_dir),
      WithNewName("2.jpg", "3.jpg", test_dir),
      WithNewName("3.jpg", "1.jpg", test_dir),
  };
  AtomicRenamer::apply(records, test_dir, false);

  EXPECT_EQ(ReadFile(test_dir / "2.jpg"), "1.jpg");
  EXPECT_EQ(ReadFile(test_dir / "3.jpg"), "2.jpg");
  EXPECT_EQ(ReadFile(test_dir / "1.jpg"), "3.jpg");
  EXPECT_EQ(ListNames(test_dir).size(), 3u);
}

TEST_F(AtomicRenamerTest, UnchangedNameIsNotMoved) {
  CreateFile("P_01_park.jpg");
  std::vector<PhotoRecord> records = {
      WithNewName("P_01_park.jpg", "P_01_park.jpg", test_dir)};

  const auto journal = AtomicRenamer::apply(records, test_dir, false);

  EXPECT_TRUE(journal.empty());
  EXPECT_TRUE(fs::exists(test_dir / "P_01_park.jpg"));
}

TEST_F(AtomicRenamerTest, CrossDirectoryCreatesDestination) {
  CreateFile("src/a.jpg", "A");
  const fs::path dst = test_dir / "out" / "renamed";

  std::vector<PhotoRecord> records = {
      WithNewName("a.jpg", "P_01_park.jpg", test_dir / "src")};
  AtomicRenamer::apply(records, dst, false);

  EXPECT_EQ(ReadFile(dst / "P_01_park.jpg"), "A");
  EXPECT_FALSE(fs::exists(test_dir / "src" / "a.jpg"));
  EXPECT_EQ(records[0].source_path, dst / "P_01_park.jpg");
}

TEST_F(AtomicRenamerTest, DryRunTouchesNothing) {
  CreateFile("a.jpg");
  const fs::path dst = test_dir / "never_created";
  std::vector<PhotoRecord> records = {
      WithNewName("a.jpg", "P_01_park.jpg", test_dir)};

  const auto journal = AtomicRenamer::apply(records, dst, true);

  EXPECT_TRUE(journal.empty());
  EXPECT_TRUE(fs::exists(test_dir / "a.jpg"));
  EXPECT_FALSE(fs::exists(dst));
  EXPECT_EQ(records[0].source_path, test_dir / "a.jpg");
  EXPECT_EQ(records[0].new_name, "P_01_park.jpg");
}

TEST_F(AtomicRenamerTest, RefusesToOverwriteForeignFile) {
  CreateFile("src/a.jpg", "photo");
  CreateFile("dst/P_01_park.jpg", "someone else");

  std::vector<PhotoRecord> records = {
      WithNewName("a.jpg", "P_01_park.jpg", test_dir / "src")};

  EXPECT_THROW(AtomicRenamer::apply(records, test_dir / "dst", false),
               RenameError);
  EXPECT_EQ(ReadFile(test_dir / "dst" / "P_01_park.jpg"), "someone else");
  EXPECT_EQ(ReadFile(test_dir / "src" / "a.jpg"), "photo");
}

TEST_F(AtomicRenamerTest, MissingSourceIsFatal) {
  std::vector<PhotoRecord> records = {
      WithNewName("ghost.jpg", "P_01_park.jpg", test_dir / "src")};
  EXPECT_THROW(AtomicRenamer::apply(records, test_dir / "dst", false),
               RenameError);
}

TEST_F(AtomicRenamerTest, JournalUndoRestoresOriginalNames) {
  CreateFile("a.jpg", "A");
  CreateFile("b.jpg", "B");
  std::vector<PhotoRecord> records = {
      WithNewName("a.jpg", "b.jpg", test_dir),
      WithNewName("b.jpg", "P_01_x.jpg", test_dir),
  };
  const auto journal = AtomicRenamer::apply(records, test_dir, false);

  const fs::path journal_path = test_dir / "journal" / "renames.json";
  IOManager::save_journal(journal_path, journal);
  ASSERT_EQ(IOManager::load_journal(journal_path).size(), 2u);

  EXPECT_TRUE(IOManager::run_undo(journal_path));

  EXPECT_EQ(ReadFile(test_dir / "a.jpg"), "A");
  EXPECT_EQ(ReadFile(test_dir / "b.jpg"), "B");
  EXPECT_FALSE(fs::exists(test_dir / "P_01_x.jpg"));
  EXPECT_FALSE(fs::exists(journal_path));
  EXPECT_FALSE(IOManager::run_undo(journal_path));
}

// The second target is taken after planning; the first photo is already
// renamed and the second is parked when the run stops.
TEST_F(AtomicRenamerTest, FailedRunKeepsJournalOfWhereFilesAre) {
  CreateFile("a.jpg", "A");
  CreateFile("b.jpg", "B");
  CreateFile("taken.jpg", "someone else");
  std::vector<PhotoRecord> records = {
      WithNewName("a.jpg", "P_01_x.jpg", test_dir),
      WithNewName("b.jpg", "taken.jpg", test_dir),
  };

  std::vector<JournalEntry> journal;
  EXPECT_THROW(AtomicRenamer::apply(records, test_dir, false, journal),
               RenameError);

  ASSERT_EQ(journal.size(), 2u);
  EXPECT_EQ(journal[0].from, test_dir / "a.jpg");
  EXPECT_EQ(journal[0].to, test_dir / "P_01_x.jpg");
  EXPECT_EQ(journal[1].from, test_dir / "b.jpg");
  EXPECT_EQ(journal[1].to.filename().string().rfind(".tmp_ren_", 0), 0u);
  EXPECT_EQ(ReadFile(journal[1].to), "B");
  EXPECT_EQ(ReadFile(test_dir / "taken.jpg"), "someone else");

  const fs::path journal_path = test_dir / "journal.json";
  IOManager::save_journal(journal_path, journal);
  EXPECT_TRUE(IOManager::run_undo(journal_path));

  EXPECT_EQ(ListNames(test_dir),
            (std::vector<std::string>{"a.jpg", "b.jpg", "taken.jpg"}));
  EXPECT_EQ(ReadFile(test_dir / "a.jpg"), "A");
  EXPECT_EQ(ReadFile(test_dir / "b.jpg"), "B");
}
