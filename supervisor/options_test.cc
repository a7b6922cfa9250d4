// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/options.h"
#include <gtest/gtest.h>

#include <fstream>
#include <stdlib.h>
#include <unistd.h>

TEST(OptionsTest, RestartDelay) {
  warden::RestartPolicy policy;
  EXPECT_EQ(5000, policy.DelayMs(1));
  EXPECT_EQ(10000, policy.DelayMs(2));
  EXPECT_EQ(30000, policy.DelayMs(6));
  EXPECT_EQ(30000, policy.DelayMs(100));
}

TEST(OptionsTest, Defaults) {
  warden::SupervisorOptions options;
  EXPECT_EQ("stop", options.StopCommand(warden::ServerKind::kVanilla));
  EXPECT_EQ(warden::DefaultReadinessPatterns(warden::ServerKind::kPaper),
            options.ReadinessPatterns(warden::ServerKind::kPaper));
  EXPECT_EQ(warden::DefaultJvmFlags(), options.jvm_flags);
}

TEST(OptionsTest, FromConfigFile) {
  char tmpl[] = "/tmp/warden_config_XXXXXX";
  int fd = mkstemp(tmpl);
  ASSERT_NE(-1, fd);
  close(fd);
  {
    std::ofstream out(tmpl);
    out << "servers_root: \"/srv/minecraft\"\n"
        << "stop_timeout_secs: 5\n"
        << "restart { max_attempts: 2 base_delay_secs: 1 }\n"
        << "readiness { kind: FORGE pattern: \"Ready!\" }\n"
        << "stop_command { kind: VELOCITY command: \"end\" }\n"
        << "default_jvm_flag: \"-XX:+UseZGC\"\n";
  }
  absl::StatusOr<warden::proto::SupervisorConfig> config =
      warden::LoadSupervisorConfig(tmpl);
  unlink(tmpl);
  ASSERT_TRUE(config.ok()) << config.status();

  warden::SupervisorOptions options;
  ASSERT_TRUE(options.FromProto(*config).ok());
  EXPECT_EQ("/srv/minecraft", options.servers_root);
  EXPECT_EQ(5, options.stop_timeout_secs);
  // Not in the file.
  EXPECT_EQ(300, options.startup_timeout_secs);
  EXPECT_EQ(2, options.restart.max_attempts);
  EXPECT_EQ(1000, options.restart.base_delay_ms);
  EXPECT_EQ(30000, options.restart.max_delay_ms);
  EXPECT_EQ(std::vector<std::string>{"Ready!"},
            options.ReadinessPatterns(warden::ServerKind::kForge));
  EXPECT_EQ("end", options.StopCommand(warden::ServerKind::kVelocity));
  EXPECT_EQ(std::vector<std::string>{"-XX:+UseZGC"}, options.jvm_flags);
}

TEST(OptionsTest, BadConfig) {
  warden::proto::SupervisorConfig config;
  config.set_log_buffer_lines(0);
  warden::SupervisorOptions options;
  EXPECT_FALSE(options.FromProto(config).ok());

  EXPECT_FALSE(warden::LoadSupervisorConfig("/no/such/file").ok());
}
