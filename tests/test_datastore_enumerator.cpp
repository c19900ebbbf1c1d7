#include <gtest/gtest.h>
#include <persistency/blob_store.hpp>
#include <persistency/datastore_enumerator.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <system_error>
#include <unistd.h>
#include "temp_dir.hpp"

namespace fs = std::filesystem;
using persistency::BlobStore;
using persistency::DatastoreEnumerator;
using persistency::PathResolver;
using studio::core::Bytes;
using studio::core::StorageErrc;

class EnumeratorTest : public ::testing::Test {
protected:
  TempDir root;
  BlobStore store{PathResolver(root.path())};
  DatastoreEnumerator enumerator{PathResolver(root.path())};

  fs::path DatastoreDir(const std::string& ds) const {
    return root.path() / "studio-datastores" / ds;
  }
};

TEST_F(EnumeratorTest, ListReturnsAllWrittenKeys) {
  ASSERT_TRUE(store.PutString("notes", "a", "alpha").HasValue());
  ASSERT_TRUE(store.PutString("notes", "b", "beta").HasValue());
  ASSERT_TRUE(store.PutString("notes", "c", "gamma").HasValue());

  auto r = enumerator.List("notes");
  ASSERT_TRUE(r.HasValue());
  std::set<std::string> keys(r.Value().begin(), r.Value().end());
  EXPECT_EQ(keys, (std::set<std::string>{"a", "b", "c"}));
  EXPECT_EQ(r.Value().size(), 3u);
}

TEST_F(EnumeratorTest, AllReturnsEveryValue) {
  ASSERT_TRUE(store.PutString("notes", "a", "alpha").HasValue());
  ASSERT_TRUE(store.PutString("notes", "b", "beta").HasValue());
  ASSERT_TRUE(store.Put("notes", "c", Bytes{0xff, 0x00}).HasValue());

  auto r = enumerator.All("notes");
  ASSERT_TRUE(r.HasValue());
  std::multiset<Bytes> values(r.Value().begin(), r.Value().end());
  std::multiset<Bytes> expected{Bytes{'a', 'l', 'p', 'h', 'a'}, Bytes{'b', 'e', 't', 'a'}, Bytes{0xff, 0x00}};
  EXPECT_EQ(values, expected);
}

TEST_F(EnumeratorTest, AllKeepsDuplicateValues) {
  ASSERT_TRUE(store.PutString("notes", "a", "same").HasValue());
  ASSERT_TRUE(store.PutString("notes", "b", "same").HasValue());
  auto r = enumerator.All("notes");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value().size(), 2u);
}

TEST_F(EnumeratorTest, NeverUsedDatastoreIsEmptyAndGetsCreated) {
  auto keys = enumerator.List("fresh");
  ASSERT_TRUE(keys.HasValue());
  EXPECT_TRUE(keys.Value().empty());
  EXPECT_TRUE(fs::is_directory(DatastoreDir("fresh")));

  auto values = enumerator.All("other-fresh");
  ASSERT_TRUE(values.HasValue());
  EXPECT_TRUE(values.Value().empty());
}

TEST_F(EnumeratorTest, ListReportsEveryUtf8NamedEntry) {
  ASSERT_TRUE(store.PutString("notes", "kept", "x").HasValue());
  { std::ofstream(DatastoreDir("notes") / ".DS_Store") << "junk"; }
  { std::ofstream(DatastoreDir("notes") / "Upper") << "junk"; }
  fs::create_directories(DatastoreDir("notes") / "nested");

  auto r = enumerator.List("notes");
  ASSERT_TRUE(r.HasValue());
  std::set<std::string> keys(r.Value().begin(), r.Value().end());
  EXPECT_EQ(keys, (std::set<std::string>{"kept", ".DS_Store", "Upper", "nested"}));
}

TEST_F(EnumeratorTest, ListSkipsNamesThatAreNotUtf8) {
  ASSERT_TRUE(store.PutString("notes", "kept", "x").HasValue());
  const std::string raw_name("bad-\xff\xfe", 6);
  {
    std::ofstream out(DatastoreDir("notes") / raw_name);
    if (!out) GTEST_SKIP() << "filesystem refuses non UTF-8 file names";
    out << "junk";
  }

  auto r = enumerator.List("notes");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), (std::vector<std::string>{"kept"}));
}

TEST_F(EnumeratorTest, AllSkipsDirectoriesWithoutFailing) {
  ASSERT_TRUE(store.PutString("notes", "kept", "x").HasValue());
  fs::create_directories(DatastoreDir("notes") / "nested");

  auto r = enumerator.All("notes");
  ASSERT_TRUE(r.HasValue());
  ASSERT_EQ(r.Value().size(), 1u);
  EXPECT_EQ(r.Value()[0], (Bytes{'x'}));
}

TEST_F(EnumeratorTest, AllSkipsFilesThatCannotBeRead) {
  if (::geteuid() == 0) GTEST_SKIP() << "permission bits do not restrict root";
  ASSERT_TRUE(store.PutString("notes", "kept", "x").HasValue());
  ASSERT_TRUE(store.PutString("notes", "locked", "secret").HasValue());
  fs::permissions(DatastoreDir("notes") / "locked", fs::perms::none);

  auto r = enumerator.All("notes");
  fs::permissions(DatastoreDir("notes") / "locked", fs::perms::owner_all);
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), (std::vector<Bytes>{Bytes{'x'}}));
}

#ifdef __linux__
// /proc/self/mem is a regular file whose read at offset 0 fails with EIO, even for root
TEST_F(EnumeratorTest, AllSkipsRegularFileWhoseReadFails) {
  const fs::path mem("/proc/self/mem");
  auto direct = persistency::ReadEntryFile(mem);
  if (direct.HasValue()) GTEST_SKIP() << "reading /proc/self/mem does not fail here";

  ASSERT_TRUE(store.PutString("notes", "kept", "x").HasValue());
  std::error_code ec;
  fs::create_symlink(mem, DatastoreDir("notes") / "memory", ec);
  ASSERT_FALSE(ec) << ec.message();

  auto r = enumerator.All("notes");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), (std::vector<Bytes>{Bytes{'x'}}));
}
#endif

TEST_F(EnumeratorTest, DeletedKeysDisappearFromListing) {
  ASSERT_TRUE(store.PutString("notes", "a", "1").HasValue());
  ASSERT_TRUE(store.PutString("notes", "b", "2").HasValue());
  ASSERT_TRUE(store.Delete("notes", "a").HasValue());

  auto r = enumerator.List("notes");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), (std::vector<std::string>{"b"}));
}

TEST_F(EnumeratorTest, DatastoresAreIsolated) {
  ASSERT_TRUE(store.PutString("notes", "a", "1").HasValue());
  ASSERT_TRUE(store.PutString("layouts", "b", "2").HasValue());
  auto r = enumerator.List("layouts");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), (std::vector<std::string>{"b"}));
}

TEST_F(EnumeratorTest, InvalidDatastoreNameIsRejected) {
  auto l = enumerator.List("Bad");
  ASSERT_FALSE(l.HasValue());
  EXPECT_EQ(l.Error().value, StorageErrc::kInvalidName);

  auto a = enumerator.All("");
  ASSERT_FALSE(a.HasValue());
  EXPECT_EQ(a.Error().value, StorageErrc::kInvalidName);
}
