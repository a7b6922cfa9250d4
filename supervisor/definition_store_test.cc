// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/definition_store.h"
#include <gtest/gtest.h>

#include <fstream>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

class DefinitionStoreTest : public ::testing::Test {
public:
  void SetUp() override {
    char tmpl[] = "/tmp/warden_store_XXXXXX";
    ASSERT_NE(nullptr, mkdtemp(tmpl));
    dir_ = tmpl;
    filename_ = dir_ + "/servers.pb.txt";
  }

  void TearDown() override {
    unlink(filename_.c_str());
    rmdir(dir_.c_str());
  }

  static warden::ServerDefinition Def(const std::string &id,
                                      const std::string &name,
                                      uint64_t created_at) {
    warden::ServerDefinition def;
    def.id = id;
    def.name = name;
    def.created_at = created_at;
    return def;
  }

  std::string dir_;
  std::string filename_;
};

TEST_F(DefinitionStoreTest, MissingFileIsEmpty) {
  warden::DefinitionStore store(filename_);
  ASSERT_TRUE(store.Load().ok());
  EXPECT_EQ(0, store.Size());
}

TEST_F(DefinitionStoreTest, PersistsAcrossLoads) {
  {
    warden::DefinitionStore store(filename_);
    ASSERT_TRUE(store.Load().ok());
    ASSERT_TRUE(store.Put(Def("b", "second", 200)).ok());
    ASSERT_TRUE(store.Put(Def("a", "first", 100)).ok());
    ASSERT_TRUE(store.UpdateStatus("a", warden::ServerState::kRunning, 77).ok());
  }
  warden::DefinitionStore store(filename_);
  ASSERT_TRUE(store.Load().ok());
  ASSERT_EQ(2, store.Size());

  std::vector<warden::ServerDefinition> list = store.List();
  EXPECT_EQ("first", list[0].name);
  EXPECT_EQ("second", list[1].name);

  absl::StatusOr<warden::ServerDefinition> a = store.Find("a");
  ASSERT_TRUE(a.ok());
  EXPECT_EQ(warden::ServerState::kRunning, a->status);
  EXPECT_EQ(77, a->pid);
  EXPECT_NE(0, a->updated_at);
}

TEST_F(DefinitionStoreTest, Remove) {
  warden::DefinitionStore store(filename_);
  ASSERT_TRUE(store.Put(Def("a", "first", 1)).ok());
  EXPECT_TRUE(store.Contains("a"));
  ASSERT_TRUE(store.Remove("a").ok());
  EXPECT_FALSE(store.Contains("a"));
  EXPECT_EQ(absl::StatusCode::kNotFound, store.Remove("a").code());
  EXPECT_EQ(absl::StatusCode::kNotFound, store.Find("a").status().code());
  EXPECT_EQ(absl::StatusCode::kNotFound,
            store.UpdateStatus("a", warden::ServerState::kStopped, 0).code());
}

TEST_F(DefinitionStoreTest, DuplicateIdsRejected) {
  std::ofstream out(filename_);
  out << "server { id: \"x\" name: \"one\" }\n"
      << "server { id: \"x\" name: \"two\" }\n";
  out.close();
  warden::DefinitionStore store(filename_);
  EXPECT_FALSE(store.Load().ok());
}

TEST_F(DefinitionStoreTest, BadFile) {
  std::ofstream out(filename_);
  out << "this is not a server store";
  out.close();
  warden::DefinitionStore store(filename_);
  EXPECT_FALSE(store.Load().ok());
}

TEST_F(DefinitionStoreTest, FailedSaveLeavesMemoryUnchanged) {
  warden::DefinitionStore store(dir_ + "/no/such/dir/servers.pb.txt");
  EXPECT_FALSE(store.Put(Def("a", "first", 1)).ok());
  EXPECT_EQ(0, store.Size());
}

TEST_F(DefinitionStoreTest, FailedStatusUpdateRollsBack) {
  warden::DefinitionStore store(filename_);
  ASSERT_TRUE(store.Put(Def("a", "first", 1)).ok());

  // The rename cannot replace a directory.
  unlink(filename_.c_str());
  ASSERT_EQ(0, mkdir(filename_.c_str(), 0755));
  EXPECT_FALSE(store.UpdateStatus("a", warden::ServerState::kRunning, 42).ok());
  absl::StatusOr<warden::ServerDefinition> def = store.Find("a");
  ASSERT_TRUE(def.ok());
  EXPECT_EQ(warden::ServerState::kStopped, def->status);
  EXPECT_EQ(0, def->pid);
  EXPECT_NE(0, access((filename_ + ".tmp").c_str(), F_OK));
  rmdir(filename_.c_str());
}

TEST(MemoryDefinitionStoreTest, NoFile) {
  warden::DefinitionStore store("");
  ASSERT_TRUE(store.Load().ok());
  warden::ServerDefinition def;
  def.id = "m";
  def.name = "memory";
  ASSERT_TRUE(store.Put(def).ok());
  EXPECT_EQ(1, store.Size());
}
