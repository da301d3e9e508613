#include <format> // std::format

#include <Spank++/Core/OptionCache.hpp>
#include <Spank++/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using spankpp::core::OptionCache;
using spankpp::utils::error::SpankErrorCode;
using spankpp::utils::types::i32;
using spankpp::utils::types::None;
using spankpp::utils::types::Some;
using spankpp::utils::types::String;

class OptionCacheTest : public Test {
 protected:
  OptionCache m_cache;
};

TEST_F(OptionCacheTest, SlotsFollowCommitOrder) {
  for (i32 expected = 0; expected < 5; ++expected) {
    ASSERT_TRUE(m_cache.nextSlot().has_value());
    EXPECT_EQ(*m_cache.nextSlot(), expected);
    EXPECT_EQ(m_cache.commit(std::format("opt{}", expected)), expected);
  }

  EXPECT_EQ(m_cache.nameAt(0), "opt0");
  EXPECT_EQ(m_cache.nameAt(3), "opt3");
  EXPECT_EQ(m_cache.options().size(), 5U);
}

TEST_F(OptionCacheTest, SlotsStayStableAfterCaptures) {
  m_cache.commit("a");
  m_cache.commit("b");

  ASSERT_TRUE(m_cache.capture(1, Some(String("x"))).has_value());
  m_cache.commit("c");

  EXPECT_EQ(m_cache.nameAt(0), "a");
  EXPECT_EQ(m_cache.nameAt(1), "b");
  EXPECT_EQ(m_cache.nameAt(2), "c");
}

TEST_F(OptionCacheTest, UnknownSlotHasNoName) {
  m_cache.commit("only");

  EXPECT_FALSE(m_cache.nameAt(-1).has_value());
  EXPECT_FALSE(m_cache.nameAt(1).has_value());
}

TEST_F(OptionCacheTest, CaptureOfUnknownSlotFailsWithoutSideEffects) {
  m_cache.commit("known");

  const auto result = m_cache.capture(7, Some(String("v")));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), SpankErrorCode::Custom);
  EXPECT_NE(result.error().message().find('7'), String::npos);
  EXPECT_EQ(m_cache.find("known"), nullptr);
}

TEST_F(OptionCacheTest, LastCapturedValueWins) {
  const i32 slot = m_cache.commit("prio");

  ASSERT_TRUE(m_cache.capture(slot, Some(String("v1"))).has_value());
  ASSERT_TRUE(m_cache.capture(slot, Some(String("v2"))).has_value());

  const OptionCache::Value* value = m_cache.find("prio");

  ASSERT_NE(value, nullptr);
  ASSERT_TRUE(value->has_value());
  EXPECT_EQ(**value, "v2");
}

TEST_F(OptionCacheTest, FlagIsPresentWithoutValue) {
  const i32 slot = m_cache.commit("verbose");

  EXPECT_EQ(m_cache.find("verbose"), nullptr);

  ASSERT_TRUE(m_cache.capture(slot, None).has_value());

  const OptionCache::Value* value = m_cache.find("verbose");

  ASSERT_NE(value, nullptr);
  EXPECT_FALSE(value->has_value());
}

TEST_F(OptionCacheTest, StoreOverwritesCapturedValue) {
  const i32 slot = m_cache.commit("name");

  ASSERT_TRUE(m_cache.capture(slot, Some(String("first"))).has_value());
  m_cache.store("name", Some(String("second")));

  ASSERT_NE(m_cache.find("name"), nullptr);
  EXPECT_EQ(*m_cache.find("name"), "second");
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
