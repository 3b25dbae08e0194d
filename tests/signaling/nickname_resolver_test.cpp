// WatchParty - Watch-party signaling and process supervision core
// Tests for nickname collision resolution

#include <gtest/gtest.h>
#include "watchparty/signaling/nickname_resolver.hpp"

#include <set>
#include <string>

namespace watchparty {
namespace signaling {
namespace test {

TEST(NicknameResolverTest, FreeNicknameIsKept) {
    EXPECT_EQ(resolveNickname("Saber", {"Host"}), "Saber");
}

TEST(NicknameResolverTest, CollisionGetsSmallestFreeSuffix) {
    EXPECT_EQ(resolveNickname("Saber", {"Host", "Saber"}), "Saber_2");
    EXPECT_EQ(resolveNickname("Saber", {"Saber", "Saber_2"}), "Saber_3");
    EXPECT_EQ(resolveNickname("Saber", {"Saber", "Saber_3"}), "Saber_2");
}

TEST(NicknameResolverTest, HostNicknameIsNeverHandedOut) {
    EXPECT_EQ(resolveNickname("Host", {"Host"}), "Host_2");
}

TEST(NicknameResolverTest, RepeatedJoinsYieldDistinctNames) {
    std::set<std::string> inUse{"Host"};
    for (int i = 0; i < 5; ++i) {
        auto assigned = resolveNickname("Archer", inUse);
        EXPECT_EQ(inUse.count(assigned), 0u);
        inUse.insert(assigned);
    }

    std::set<std::string> expected{"Host", "Archer", "Archer_2", "Archer_3", "Archer_4", "Archer_5"};
    EXPECT_EQ(inUse, expected);
}

TEST(NicknameResolverTest, SuffixOfSuffixedName) {
    EXPECT_EQ(resolveNickname("Saber_2", {"Saber", "Saber_2"}), "Saber_2_2");
}

TEST(NicknameResolverTest, NormalizeTrimsWhitespace) {
    EXPECT_EQ(normalizeNickname("  Saber\t"), "Saber");
    EXPECT_EQ(normalizeNickname(" \n "), "");
    EXPECT_EQ(normalizeNickname("Lancer Alter"), "Lancer Alter");
}

} // namespace test
} // namespace signaling
} // namespace watchparty
