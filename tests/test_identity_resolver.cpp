#include "tracking/IdentityResolver.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "utils/Logger.hpp"

using namespace StatTrack;

namespace {

Core::PlayerRef player(const std::string& name, const std::string& id = "", int team = -1) {
	Core::PlayerRef ref;
	ref.name = name;
	ref.inGameId = id;
	ref.team = team;
	return ref;
}

Utils::TimePoint at(int seconds) {
	return Utils::fromMillisSinceEpoch(1759613271000LL + seconds * 1000LL);
}

} // namespace

class IdentityResolverTest : public ::testing::Test {
protected:
	void SetUp() override { Utils::getLogger().setConsoleEnabled(false); }
	void TearDown() override { Utils::getLogger().setConsoleEnabled(true); }

	Tracking::IdentityResolver resolver{"hardcore-1", std::chrono::seconds(300)};
};

TEST_F(IdentityResolverTest, IdKeyedIdentityFollowsRenames) {
	const auto first = resolver.resolve(player("Alice", "76561198000000001"), at(0));
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(*first, "id:76561198000000001");

	const auto renamed = resolver.resolve(player("Alice2", "76561198000000001"), at(10));
	ASSERT_TRUE(renamed.has_value());
	EXPECT_EQ(*renamed, *first);
	EXPECT_EQ(resolver.identity(*first)->displayName, "Alice2");
	EXPECT_EQ(resolver.findByName("Alice2").value_or(""), *first);
	EXPECT_FALSE(resolver.findByName("Alice").has_value());
}

TEST_F(IdentityResolverTest, BotsAndNamelessRefsAreNotTracked) {
	EXPECT_FALSE(resolver.resolve(player("Rifleman", "INVALID"), at(0)).has_value());
	EXPECT_FALSE(resolver.resolve(player(""), at(0)).has_value());
	EXPECT_EQ(resolver.size(), 0u);
}

TEST_F(IdentityResolverTest, NameOnlyIdentityAdoptsLaterId) {
	const std::string key = resolver.resolveName("ArmoredBear", at(0));
	EXPECT_EQ(key, "name:ArmoredBear");

	const auto withId = resolver.resolve(player("ArmoredBear", "76561198995742987", 0), at(5));
	ASSERT_TRUE(withId.has_value());
	EXPECT_EQ(*withId, key);
	EXPECT_EQ(resolver.findById("76561198995742987").value_or(""), key);
	EXPECT_EQ(resolver.identity(key)->inGameId, "76561198995742987");
	EXPECT_EQ(resolver.size(), 1u);
}

TEST_F(IdentityResolverTest, LinkIdRefusesIdOwnedByAnotherIdentity) {
	const auto owner = resolver.resolve(player("Bob", "2"), at(0));
	const std::string other = resolver.resolveName("Robert", at(1));

	EXPECT_FALSE(resolver.linkId(other, "2"));
	EXPECT_TRUE(resolver.linkId(*owner, "2"));
	EXPECT_TRUE(resolver.linkId(other, "3"));
	EXPECT_FALSE(resolver.linkId(other, "4"));
	EXPECT_FALSE(resolver.linkId("name:nobody", "5"));
}

TEST_F(IdentityResolverTest, AmbiguousNamePrefersMostRecentAndIsReported) {
	resolver.resolve(player("Sniper", "1"), at(0));
	resolver.resolve(player("Sniper", "2"), at(30));

	const std::string chosen = resolver.resolveName("Sniper", at(40));
	EXPECT_EQ(chosen, "id:2");

	ASSERT_EQ(resolver.ambiguities().size(), 1u);
	const auto& report = resolver.ambiguities().front();
	EXPECT_EQ(report.displayName, "Sniper");
	EXPECT_EQ(report.candidates.size(), 2u);
	EXPECT_EQ(report.chosen, "id:2");
}

TEST_F(IdentityResolverTest, AmbiguityListIsBounded) {
	Tracking::IdentityResolver small("coop", std::chrono::seconds(300), 2);
	small.resolve(player("Twin", "1"), at(0));
	small.resolve(player("Twin", "2"), at(1));
	for (int i = 0; i < 5; ++i) {
		small.resolveName("Twin", at(10 + i));
	}
	EXPECT_EQ(small.ambiguities().size(), 2u);
}

TEST_F(IdentityResolverTest, SnapshotNameMatchesRecentIdentity) {
	const auto alice = resolver.resolve(player("Alice", "76561198000000001"), at(0));
	EXPECT_EQ(resolver.resolveSnapshotName("Alice", at(120)), *alice);
}

TEST_F(IdentityResolverTest, SnapshotNameDoesNotAttachToStaleIdentity) {
	const auto alice = resolver.resolve(player("Alice", "76561198000000001"), at(0));
	const std::string fromSnapshot = resolver.resolveSnapshotName("Alice", at(3600));
	EXPECT_NE(fromSnapshot, *alice);
	EXPECT_EQ(fromSnapshot, "name:Alice");

	// The same stale name maps to the same name identity next time.
	EXPECT_EQ(resolver.resolveSnapshotName("Alice", at(7200)), fromSnapshot);
}

TEST_F(IdentityResolverTest, IdOnlyResolutionCreatesNamelessIdentity) {
	const std::string key = resolver.resolveId("76561198995742987", at(0));
	EXPECT_EQ(key, "id:76561198995742987");
	EXPECT_TRUE(resolver.identity(key)->displayName.empty());

	resolver.resolve(player("ArmoredBear", "76561198995742987"), at(1));
	EXPECT_EQ(resolver.identity(key)->displayName, "ArmoredBear");
}
