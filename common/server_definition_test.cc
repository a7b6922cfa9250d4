// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/server_definition.h"
#include <gtest/gtest.h>

using ServerKind = warden::ServerKind;

TEST(ServerDefinitionTest, Kinds) {
  absl::StatusOr<ServerKind> kind = warden::ParseServerKind("Paper");
  ASSERT_TRUE(kind.ok());
  EXPECT_EQ(ServerKind::kPaper, *kind);
  EXPECT_FALSE(warden::ParseServerKind("bukkit").ok());

  EXPECT_TRUE(warden::IsProxy(ServerKind::kBungeeCord));
  EXPECT_TRUE(warden::IsProxy(ServerKind::kVelocity));
  EXPECT_FALSE(warden::IsProxy(ServerKind::kForge));

  EXPECT_STREQ("stop", warden::DefaultStopCommand(ServerKind::kPaper));
  EXPECT_STREQ("end", warden::DefaultStopCommand(ServerKind::kWaterfall));
  EXPECT_STREQ("shutdown", warden::DefaultStopCommand(ServerKind::kVelocity));
}

TEST(ServerDefinitionTest, Validate) {
  warden::ServerDefinition def;
  def.name = "survival";
  EXPECT_TRUE(def.Validate().ok());

  def.min_ram_mb = 4096;
  def.max_ram_mb = 2048;
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, def.Validate().code());

  def.min_ram_mb = 1024;
  def.port = 70000;
  EXPECT_FALSE(def.Validate().ok());

  def.port = 25566;
  def.name = "";
  EXPECT_FALSE(def.Validate().ok());
}

TEST(ServerDefinitionTest, LaunchCommand) {
  warden::ServerDefinition def;
  def.name = "survival";
  def.java_path = "/usr/bin/java";
  def.min_ram_mb = 512;
  def.max_ram_mb = 4096;
  def.jvm_flags = " -Dfoo=bar  -Dbaz=1 ";

  warden::LaunchCommand cmd =
      warden::BuildLaunchCommand(def, {"-XX:+UseG1GC"});
  EXPECT_EQ("/usr/bin/java", cmd.executable);
  std::vector<std::string> expected = {
      "-Xms512M", "-Xmx4096M", "-Dfoo=bar", "-Dbaz=1",
      "-XX:+UseG1GC", "-jar", "server.jar", "nogui"};
  EXPECT_EQ(expected, cmd.args);
  EXPECT_EQ("/usr/bin/java -Xms512M -Xmx4096M -Dfoo=bar -Dbaz=1 "
            "-XX:+UseG1GC -jar server.jar nogui",
            cmd.ToString());

  // Proxies don't get nogui.
  def.kind = ServerKind::kVelocity;
  def.jvm_flags = "";
  cmd = warden::BuildLaunchCommand(def, {});
  ASSERT_FALSE(cmd.args.empty());
  EXPECT_EQ("server.jar", cmd.args.back());
}

TEST(ServerDefinitionTest, DefaultJvmFlags) {
  const std::vector<std::string> &flags = warden::DefaultJvmFlags();
  ASSERT_FALSE(flags.empty());
  EXPECT_EQ("-XX:+UseG1GC", flags[0]);
}

TEST(ServerDefinitionTest, Proto) {
  warden::ServerDefinition def;
  def.id = "1234";
  def.name = "creative";
  def.kind = ServerKind::kFabric;
  def.version = "1.20.4";
  def.port = 25570;
  def.auto_start = true;
  def.status = warden::ServerState::kRunning;
  def.pid = 42;

  warden::proto::ServerDefinition proto;
  def.ToProto(&proto);
  EXPECT_EQ(warden::proto::FABRIC, proto.kind());

  warden::ServerDefinition decoded;
  decoded.FromProto(proto);
  EXPECT_EQ("creative", decoded.name);
  EXPECT_EQ(ServerKind::kFabric, decoded.kind);
  EXPECT_EQ(25570, decoded.port);
  EXPECT_TRUE(decoded.auto_start);
  EXPECT_EQ(warden::ServerState::kRunning, decoded.status);
  EXPECT_EQ(42, decoded.pid);
}
