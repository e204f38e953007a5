#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "utils/transparent_hash.hpp"

using model_batcher::TransparentHash;

TEST(TransparentHash_Unit, TransparentLookup)
{
  std::unordered_map<std::string, int, TransparentHash, std::equal_to<>> map;
  map.try_emplace("W-0", 1);
  map.try_emplace(std::string{"DATA_QUEUE"}, 2);

  const std::string str_key = "W-0";
  const std::string_view sv_key = "DATA_QUEUE";
  const char* c_key = "W-0";

  auto iter1 = map.find(str_key);
  ASSERT_NE(iter1, map.end());
  EXPECT_EQ(iter1->second, 1);

  auto iter2 = map.find(sv_key);
  ASSERT_NE(iter2, map.end());
  EXPECT_EQ(iter2->second, 2);

  auto iter3 = map.find(c_key);
  ASSERT_NE(iter3, map.end());
  EXPECT_EQ(iter3->second, 1);
}

TEST(TransparentHash_Unit, LookupMissingKeysReturnsEnd)
{
  std::unordered_map<std::string, int, TransparentHash, std::equal_to<>> map;
  map.emplace("W-0", 1);

  EXPECT_EQ(map.find(std::string{"W-1"}), map.end());
  EXPECT_EQ(map.find(std::string_view{"W-2"}), map.end());
  EXPECT_EQ(map.find("W-3"), map.end());
}

TEST(TransparentHash_Unit, AllKeyFormsHashAlike)
{
  const TransparentHash hash;
  const std::string key = "worker-context";
  EXPECT_EQ(hash(key), hash(std::string_view{key}));
  EXPECT_EQ(hash(key), hash(key.c_str()));
}
