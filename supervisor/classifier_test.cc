// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/server_definition.h"
#include "supervisor/classifier.h"
#include <gtest/gtest.h>

using Kind = warden::Classification::Kind;

class ClassifierTest : public ::testing::Test {
public:
  void SetUp() override {
    auto c = warden::Classifier::Create(
        warden::DefaultReadinessPatterns(warden::ServerKind::kPaper));
    ASSERT_TRUE(c.ok());
    classifier_ = *c;
  }

  std::optional<warden::Classification> Classify(const std::string &line) {
    return classifier_->Classify(line);
  }

  std::shared_ptr<const warden::Classifier> classifier_;
};

TEST_F(ClassifierTest, Ready) {
  auto c = Classify(
      "[12:00:00] [Server thread/INFO]: Done (5.123s)! For help, type \"help\"");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kReady, c->kind);

  // Some locales print a comma.
  c = Classify("[12:00:00 INFO]: Done (5,1s)! For help, type \"help\"");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kReady, c->kind);
}

TEST_F(ClassifierTest, ProxyReady) {
  auto c = warden::Classifier::Create(
      warden::DefaultReadinessPatterns(warden::ServerKind::kBungeeCord));
  ASSERT_TRUE(c.ok());
  auto result =
      (*c)->Classify("12:00:00 [INFO] Listening on /0.0.0.0:25577");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(Kind::kReady, result->kind);
  EXPECT_FALSE((*c)->Classify("[12:00:00] Done (1.0s)!").has_value());
}

TEST_F(ClassifierTest, JoinLeave) {
  auto c = Classify("[12:00:00] [Server thread/INFO]: Steve joined the game");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kPlayerJoin, c->kind);
  EXPECT_EQ("Steve", c->name);

  c = Classify("[12:00:00 INFO]: Alex_99 left the game");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kPlayerLeave, c->kind);
  EXPECT_EQ("Alex_99", c->name);
}

TEST_F(ClassifierTest, Uuid) {
  auto c = Classify("[12:00:00] [User Authenticator #1/INFO]: UUID of player "
                    "Steve is 069a79f4-44e9-4726-a5be-fca90e38aaf5");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kPlayerUuid, c->kind);
  EXPECT_EQ("Steve", c->name);
  EXPECT_EQ("069a79f4-44e9-4726-a5be-fca90e38aaf5", c->detail);
}

TEST_F(ClassifierTest, Tps) {
  auto c = Classify(
      "[12:00:00 INFO]: TPS from last 1m, 5m, 15m: 19.97, 20.0, 20.0");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kTps, c->kind);
  EXPECT_DOUBLE_EQ(19.97, c->tps);

  c = Classify("[12:00:00 INFO]: TPS from last 1m, 5m, 15m: *20,0, *20,0");
  ASSERT_TRUE(c.has_value());
  EXPECT_DOUBLE_EQ(20.0, c->tps);
}

TEST_F(ClassifierTest, Chat) {
  auto c = Classify("[12:00:00] [Server thread/INFO]: <Steve> hello world");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kChat, c->kind);
  EXPECT_EQ("Steve", c->name);
  EXPECT_EQ("hello world", c->detail);

  // Chat that looks like something else is still chat.
  c = Classify("[12:00:00] [Server thread/INFO]: <Alex> Bob joined the game");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kChat, c->kind);
  EXPECT_EQ("Alex", c->name);
}

TEST_F(ClassifierTest, Advancement) {
  auto c = Classify("[12:00:00] [Server thread/INFO]: Steve has made the "
                    "advancement [Stone Age]");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kAdvancement, c->kind);
  EXPECT_EQ("Steve", c->name);
  EXPECT_EQ("Stone Age", c->detail);

  c = Classify("[12:00:00] [Server thread/INFO]: Alex has completed the "
               "challenge [Monsters Hunted]");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ("Monsters Hunted", c->detail);
}

TEST_F(ClassifierTest, Death) {
  auto c = Classify(
      "[12:00:00] [Server thread/INFO]: Steve was slain by Zombie");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kDeath, c->kind);
  EXPECT_EQ("Steve", c->name);
  EXPECT_EQ("Steve was slain by Zombie", c->detail);

  c = Classify("[12:00:00] [Server thread/INFO]: Alex fell from a high place");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kDeath, c->kind);
}

TEST_F(ClassifierTest, CrashReport) {
  auto c = Classify("---- Minecraft Crash Report ----");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kCrashReport, c->kind);

  // Chat quoting the marker is still chat.
  c = Classify("[12:00:00] [Server thread/INFO]: <Steve> ---- Minecraft Crash "
               "Report ----");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(Kind::kChat, c->kind);
}

TEST_F(ClassifierTest, Unclassified) {
  EXPECT_FALSE(
      Classify("[12:00:00] [Server thread/INFO]: Preparing spawn area: 50%")
          .has_value());
  EXPECT_FALSE(Classify("").has_value());
}

TEST(ClassifierCreateTest, BadPattern) {
  auto c = warden::Classifier::Create({"Done (unbalanced"});
  EXPECT_FALSE(c.ok());
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, c.status().code());
}
