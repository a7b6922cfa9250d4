// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/sampler.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdlib.h>

class SamplerTest : public ::testing::Test {
public:
  void SetUp() override {
    char tmpl[] = "/tmp/warden_proc_XXXXXX";
    ASSERT_NE(nullptr, mkdtemp(tmpl));
    root_ = tmpl;
    std::filesystem::create_directories(root_ + "/42");
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  // Writes a stat file with the given utime and stime.  The command name
  // has a space and a parenthesis in it.
  void WriteStat(uint64_t utime, uint64_t stime) {
    std::ofstream out(root_ + "/42/stat");
    out << "42 (java (main) x) S 1 42 42 0 -1 4194560 100 0 0 0 " << utime
        << " " << stime << " 0 0 20 0 30 0 1000 123456 789\n";
  }

  void WriteStatm(uint64_t resident_pages) {
    std::ofstream out(root_ + "/42/statm");
    out << "100000 " << resident_pages << " 500 10 0 2000 0\n";
  }

  std::string root_;
};

TEST_F(SamplerTest, CpuAndMemory) {
  warden::Sampler sampler(root_);
  sampler.SetTicksPerSecond(100);
  sampler.SetPageSize(4096);

  WriteStat(100, 50);
  WriteStatm(1000);
  absl::StatusOr<warden::ResourceUsage> usage = sampler.Sample(42, 1000000000);
  ASSERT_TRUE(usage.ok()) << usage.status();
  // No previous sample.
  EXPECT_EQ(0, usage->cpu_percent);
  EXPECT_EQ(1000 * 4096, usage->resident_bytes);

  // 100 more ticks (1 second of cpu) over 2 seconds.
  WriteStat(150, 100);
  usage = sampler.Sample(42, 3000000000);
  ASSERT_TRUE(usage.ok()) << usage.status();
  EXPECT_DOUBLE_EQ(50.0, usage->cpu_percent);
}

TEST_F(SamplerTest, MissingProcess) {
  warden::Sampler sampler(root_);
  EXPECT_FALSE(sampler.Sample(43, 1).ok());
}

TEST_F(SamplerTest, Malformed) {
  warden::Sampler sampler(root_);
  {
    std::ofstream out(root_ + "/42/stat");
    out << "42 (java) S 1 2\n";
  }
  EXPECT_FALSE(sampler.ReadCpuTicks(42).ok());
}

TEST_F(SamplerTest, RetainDropsExitedProcesses) {
  std::filesystem::create_directories(root_ + "/43");
  {
    std::ofstream out(root_ + "/43/stat");
    out << "43 (java) S 1 43 43 0 -1 4194560 100 0 0 0 10 10 0 0 20 0 30 0 "
           "1000 123456 789\n";
    std::ofstream statm(root_ + "/43/statm");
    statm << "100000 10 500 10 0 2000 0\n";
  }
  WriteStat(100, 50);
  WriteStatm(1000);
  warden::Sampler sampler(root_);
  ASSERT_TRUE(sampler.Sample(42, 1).ok());
  ASSERT_TRUE(sampler.Sample(43, 1).ok());
  EXPECT_EQ(2, sampler.NumTracked());

  // 43 exited, only 42 was seen in this pass.
  sampler.Retain({42});
  EXPECT_EQ(1, sampler.NumTracked());
  sampler.Retain({});
  EXPECT_EQ(0, sampler.NumTracked());
}
