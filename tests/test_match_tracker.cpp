#include "tracking/MatchTracker.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "input/EventParser.hpp"
#include "utils/Logger.hpp"

using namespace StatTrack;
using Core::MatchState;
using Core::Metric;

namespace {

const std::string kAlice = "Alice[76561198000000001, team 0]";
const std::string kBob = "Bob[76561198000000002, team 1]";
const std::string kCarl = "Carl[76561198000000003, team 0]";

} // namespace

class MatchTrackerTest : public ::testing::Test {
protected:
	void SetUp() override { Utils::getLogger().setConsoleEnabled(false); }
	void TearDown() override { Utils::getLogger().setConsoleEnabled(true); }

	std::string stamp() {
		char buf[64];
		std::snprintf(buf, sizeof(buf), "[2025.10.04-21.%02d.%02d:000][%d]", 30 + m_second / 60, m_second % 60, m_second);
		++m_second;
		return buf;
	}

	Tracking::TrackerOutput feed(Tracking::MatchTracker& t, const std::string& body) {
		Core::RawLine line;
		line.serverId = t.serverId();
		line.fileIdentity = "2049:131077";
		line.startOffset = m_offset;
		line.text = stamp() + body;
		m_offset += line.text.size() + 1;
		line.endOffset = m_offset;

		auto out = t.handle(m_parser.parse(line));
		for (const auto& batch : out.batches) {
			for (const auto& delta : batch.deltas) {
				m_deltas.push_back(delta);
			}
		}
		return out;
	}

	Tracking::TrackerOutput feed(const std::string& body) { return feed(tracker, body); }

	Utils::TimePoint now() const {
		return *Utils::parseGameTimestamp("2025.10.04-21.30.00:000") + std::chrono::seconds(m_second);
	}

	Core::LiveSnapshot snapshot(const std::vector<std::string>& names) {
		Core::LiveSnapshot snap;
		snap.serverId = tracker.serverId();
		snap.queriedAt = now();
		snap.reachable = true;
		std::uint8_t index = 0;
		for (const auto& name : names) {
			Core::SnapshotPlayer p;
			p.index = index++;
			p.name = name;
			snap.players.push_back(p);
		}
		++m_second;
		return snap;
	}

	std::map<std::string, Core::PlayerMatchStats> totals() const {
		std::map<std::string, Core::PlayerMatchStats> rows;
		for (const auto& delta : m_deltas) {
			rows[delta.identity].identity = delta.identity;
			rows[delta.identity].apply(delta);
		}
		return rows;
	}

	Input::EventParser m_parser;
	Tracking::MatchTracker tracker{"hardcore-1"};
	std::vector<Core::StatDelta> m_deltas;
	std::uint64_t m_offset = 0;
	int m_second = 0;
};

TEST_F(MatchTrackerTest, ScenarioKillInRoundThenMapChangeConcludes) {
	feed("LogNet: Join succeeded: Alice");
	feed("LogNet: Join succeeded: Bob");
	feed("LogGameplayEvents: Display: Round 1 started");
	feed("LogGameplayEvents: Display: " + kAlice + " killed " + kBob + " with BP_Firearm_AK74_C_2147480339 (headshot)");
	feed("LogGameplayEvents: Display: Round 1 Over: Team 0 won (win reason: Elimination)");
	const auto out = feed("LogLoad: LoadMap: /Game/Maps/Farmhouse/Farmhouse?Scenario=Scenario_Farmhouse_Push_Security?Lighting=Night");

	ASSERT_EQ(out.matchesClosed.size(), 1u);
	EXPECT_EQ(out.matchesClosed[0].state, MatchState::Concluded);
	EXPECT_EQ(out.matchesClosed[0].roundsPlayed, 1);
	EXPECT_EQ(out.matchesClosed[0].winningTeam, 0);
	ASSERT_EQ(out.matchesOpened.size(), 1u);
	EXPECT_EQ(out.matchesOpened[0].mapName, "Farmhouse");
	EXPECT_EQ(tracker.phase(), MatchState::Warmup);

	const auto rows = totals();
	ASSERT_EQ(rows.count("name:Alice"), 1u);
	ASSERT_EQ(rows.count("name:Bob"), 1u);
	const auto& alice = rows.at("name:Alice");
	const auto& bob = rows.at("name:Bob");
	EXPECT_EQ(alice.kills, 1);
	EXPECT_EQ(alice.headshots, 1);
	EXPECT_EQ(alice.deaths, 0);
	EXPECT_EQ(alice.weapons.at("AK74").kills, 1);
	EXPECT_EQ(alice.weapons.at("AK74").headshots, 1);
	EXPECT_EQ(bob.deaths, 1);
	EXPECT_EQ(bob.kills, 0);
}

TEST_F(MatchTrackerTest, IllegalTransitionsAreIgnored) {
	feed("LogGameplayEvents: Display: Round 1 Over: Team 0 won (win reason: Elimination)");
	EXPECT_EQ(tracker.phase(), MatchState::Idle);
	EXPECT_EQ(tracker.counters().ignoredTransitions, 1u);

	feed("LogLoad: LoadMap: /Game/Maps/Ministry/Ministry?Scenario=Scenario_Ministry_Checkpoint_Security");
	feed("LogGameMode: Display: Round Over: Team 1 won (win reason: Objective)");
	EXPECT_EQ(tracker.phase(), MatchState::Warmup);
	EXPECT_EQ(tracker.counters().ignoredTransitions, 2u);

	feed("LogGameplayEvents: Display: Round 1 started");
	feed("LogGameplayEvents: Display: Round 1 started");
	EXPECT_EQ(tracker.phase(), MatchState::RoundActive);
	EXPECT_EQ(tracker.currentMatch()->roundNumber, 1);
	EXPECT_EQ(tracker.counters().ignoredTransitions, 3u);

	// Sandstorm logs the end of a round twice; the second line changes nothing.
	feed("LogGameplayEvents: Display: Round 1 Over: Team 1 won (win reason: Objective)");
	feed("LogGameMode: Display: Round Over: Team 1 won (win reason: Objective)");
	EXPECT_EQ(tracker.currentMatch()->roundsPlayed, 1);
	EXPECT_EQ(tracker.phase(), MatchState::RoundEnd);

	feed("LogGameplayEvents: Display: Pre-round 2 started");
	EXPECT_EQ(tracker.phase(), MatchState::Warmup);
	feed("LogGameplayEvents: Display: Round 2 started");
	EXPECT_EQ(tracker.phase(), MatchState::RoundActive);
	EXPECT_EQ(tracker.currentMatch()->roundNumber, 2);
}

TEST_F(MatchTrackerTest, RandomEventSequencesKeepStateMachineLegal) {
	const std::vector<std::string> bodies = {
		"LogGameplayEvents: Display: Round 1 started",
		"LogGameplayEvents: Display: Round 2 started",
		"LogGameplayEvents: Display: Pre-round 2 started",
		"LogGameplayEvents: Display: Round 1 Over: Team 0 won (win reason: Elimination)",
		"LogGameMode: Display: Round Over: Team 1 won (win reason: Objective)",
		"LogLoad: LoadMap: /Game/Maps/Hideout/Hideout?Scenario=Scenario_Hideout_Checkpoint_Security",
		"LogSession: Display: AINSGameSession::HandleMatchHasEnded",
		"LogGameplayEvents: Display: " + kAlice + " killed " + kBob + " with BP_Firearm_M4A1_C_1",
		"LogGameplayEvents: Display: " + kAlice + " damaged " + kBob + " for 20 with BP_Firearm_M4A1_C_1",
		"LogNet: Join succeeded: Alice",
		"LogNet: Player disconnected: Alice",
		"garbage that matches nothing",
	};

	std::mt19937 rng(20251004);
	std::uniform_int_distribution<std::size_t> pick(0, bodies.size() - 1);

	for (int run = 0; run < 20; ++run) {
		Tracking::MatchTracker t("fuzz-" + std::to_string(run));
		int violations = 0;

		t.setTransitionObserver([&](MatchState from, MatchState to, std::string_view cause) {
			if (from == MatchState::Idle && to == MatchState::RoundEnd) {
				++violations;
			}
			if (from == MatchState::Idle && to != MatchState::Warmup) {
				++violations;
			}
			if (to == MatchState::RoundActive && cause != "RoundStart") {
				++violations;
			}
			if (to == MatchState::RoundEnd && from != MatchState::RoundActive) {
				++violations;
			}
		});

		for (int i = 0; i < 200; ++i) {
			const MatchState before = t.phase();
			const std::string& body = bodies[pick(rng)];
			const bool isRoundStart = body.find("Round 1 started") != std::string::npos ||
			                          body.find("Round 2 started") != std::string::npos;
			feed(t, body);
			const MatchState after = t.phase();

			EXPECT_FALSE(before == MatchState::Idle && after == MatchState::RoundEnd);
			if (after == MatchState::RoundActive && before != MatchState::RoundActive) {
				EXPECT_TRUE(isRoundStart) << "entered RoundActive on: " << body;
			}
		}
		EXPECT_EQ(violations, 0) << "run " << run;
	}
}

TEST_F(MatchTrackerTest, KillClassification) {
	feed("LogLoad: LoadMap: /Game/Maps/Precinct/Precinct?Scenario=Scenario_Precinct_Push_Security");
	feed("LogGameplayEvents: Display: Round 1 started");

	// Suicide.
	feed("LogGameplayEvents: Display: " + kAlice + " killed " + kAlice + " with BP_Projectile_M67_C_9");
	// Team kill.
	feed("LogGameplayEvents: Display: " + kAlice + " killed " + kCarl + " with BP_Firearm_M4A1_C_1");
	// Bot killer, player victim.
	feed("LogGameplayEvents: Display: Rifleman[INVALID, team 1] killed " + kCarl + " with BP_Firearm_AKM_C_1");
	// Player killer with assist, bot victim.
	feed("LogGameplayEvents: Display: " + kAlice + " + " + kCarl + " killed Rifleman[INVALID, team 1] with BP_Firearm_M4A1_C_1");
	// World kill.
	feed("LogGameplayEvents: Display: ? killed " + kBob + " with BP_Character_Player_C_1");

	const auto rows = totals();
	const auto& alice = rows.at("id:76561198000000001");
	const auto& carl = rows.at("id:76561198000000003");
	const auto& bob = rows.at("id:76561198000000002");

	EXPECT_EQ(alice.suicides, 1);
	EXPECT_EQ(alice.deaths, 1);
	EXPECT_EQ(alice.friendlyFireKills, 1);
	EXPECT_EQ(alice.kills, 1);
	EXPECT_EQ(alice.weapons.at("M4A1").kills, 1);
	EXPECT_EQ(alice.weapons.count("M67"), 0u);

	EXPECT_EQ(carl.deaths, 2);
	EXPECT_EQ(carl.assists, 1);
	EXPECT_EQ(carl.weapons.at("M4A1").assists, 1);
	EXPECT_EQ(carl.kills, 0);

	EXPECT_EQ(bob.deaths, 1);
	EXPECT_EQ(rows.size(), 3u);
}

TEST_F(MatchTrackerTest, DeltaKeysDeriveFromLinePosition) {
	feed("LogGameplayEvents: Display: Round 1 started");
	const std::uint64_t offset = m_offset;
	const auto out = feed("LogGameplayEvents: Display: " + kAlice + " killed " + kBob + " with BP_Firearm_AK74_C_1 (headshot)");

	ASSERT_EQ(out.batches.size(), 1u);
	const auto& batch = out.batches[0];
	EXPECT_EQ(batch.key, Core::lineKey("2049:131077", offset));
	ASSERT_EQ(batch.deltas.size(), 5u);
	for (std::size_t i = 0; i < batch.deltas.size(); ++i) {
		EXPECT_EQ(batch.deltas[i].idempotencyKey, batch.key + ":" + std::to_string(i));
		EXPECT_EQ(batch.deltas[i].matchId, tracker.currentMatch()->matchId);
	}

	// A second tracker fed the same line at the same position produces the same keys.
	Tracking::MatchTracker replay("hardcore-1");
	Core::RawLine line;
	line.serverId = "hardcore-1";
	line.fileIdentity = "2049:131077";
	line.startOffset = offset;
	line.text = "[2025.10.04-21.30.01:000][1]LogGameplayEvents: Display: " + kAlice + " killed " + kBob +
	            " with BP_Firearm_AK74_C_1 (headshot)";
	const auto again = replay.handle(m_parser.parse(line));
	ASSERT_EQ(again.batches.size(), 1u);
	EXPECT_EQ(again.batches[0].key, batch.key);
	EXPECT_EQ(again.batches[0].deltas.size(), batch.deltas.size());
}

TEST_F(MatchTrackerTest, CombatOutsideRoundIsFlaggedNotDropped) {
	feed("LogLoad: LoadMap: /Game/Maps/Ministry/Ministry?Scenario=Scenario_Ministry_Checkpoint_Security");
	feed("LogGameplayEvents: Display: " + kAlice + " killed " + kBob + " with BP_Firearm_AK74_C_1");

	const auto rows = totals();
	EXPECT_EQ(rows.at("id:76561198000000001").kills, 1);
	EXPECT_EQ(rows.at("id:76561198000000001").outOfRoundKills, 1);
	EXPECT_EQ(rows.at("id:76561198000000002").outOfRoundDeaths, 1);
	EXPECT_EQ(tracker.counters().outOfRoundEvents, 1u);
	for (const auto& delta : m_deltas) {
		EXPECT_TRUE(delta.outOfRound);
	}
}

TEST_F(MatchTrackerTest, CombatWithoutMatchOpensImplicitMatch) {
	const auto out = feed("LogGameplayEvents: Display: " + kAlice + " killed " + kBob + " with BP_Firearm_AK74_C_1");
	ASSERT_EQ(out.matchesOpened.size(), 1u);
	EXPECT_TRUE(out.matchesOpened[0].mapName.empty());
	EXPECT_EQ(out.sessionsOpened.size(), 2u);
	ASSERT_EQ(out.batches.size(), 1u);
	EXPECT_EQ(out.batches[0].deltas.front().matchId, out.matchesOpened[0].matchId);
}

TEST_F(MatchTrackerTest, DamageAndObjectives) {
	feed("LogGameplayEvents: Display: Round 1 started");
	feed("LogGameplayEvents: Display: " + kAlice + " damaged " + kBob + " for 37 with BP_Firearm_AK74_C_12");
	feed("LogGameplayEvents: Display: " + kAlice + " damaged Rifleman[INVALID, team 1] for 50 with BP_Firearm_AK74_C_12");
	feed("LogGameplayEvents: Display: Objective 0 was captured for team 0 from team 1 by " + kAlice + " + " + kCarl + ".");
	feed("LogGameplayEvents: Display: Objective 1 owned by team 1 was destroyed for team 0 by " + kCarl + ".");

	const auto rows = totals();
	EXPECT_EQ(rows.at("id:76561198000000001").damageDealt, 87);
	EXPECT_EQ(rows.at("id:76561198000000002").damageTaken, 37);
	EXPECT_EQ(rows.at("id:76561198000000001").objectivesCaptured, 1);
	EXPECT_EQ(rows.at("id:76561198000000003").objectivesCaptured, 1);
	EXPECT_EQ(rows.at("id:76561198000000003").objectivesDestroyed, 1);
}

TEST_F(MatchTrackerTest, ConnectThenRegisterLinksIdAndDisconnectByIdCloses) {
	feed("LogLoad: LoadMap: /Game/Maps/Ministry/Ministry?Scenario=Scenario_Ministry_Checkpoint_Security");
	auto out = feed("LogNet: Join succeeded: ArmoredBear");
	ASSERT_EQ(out.sessionsOpened.size(), 1u);
	EXPECT_EQ(out.sessionsOpened[0].identity, "name:ArmoredBear");

	out = feed("LogEOSAntiCheat: Display: ServerRegisterClient: Client: (76561198995742987) Result: (EOS_Success)");
	EXPECT_TRUE(out.sessionsOpened.empty());
	EXPECT_EQ(tracker.resolver().findById("76561198995742987").value_or(""), "name:ArmoredBear");
	EXPECT_EQ(tracker.sessions().size(), 1u);

	out = feed("LogEOSAntiCheat: Display: ServerUnregisterClient: UserId (76561198995742987), Result: (EOS_Success)");
	ASSERT_EQ(out.sessionsClosed.size(), 1u);
	EXPECT_EQ(out.sessionsClosed[0].identity, "name:ArmoredBear");
	EXPECT_TRUE(out.sessionsClosed[0].leftAt.has_value());
	EXPECT_TRUE(tracker.sessions().empty());
}

TEST_F(MatchTrackerTest, ReturningPlayerNameConnectFoldsIntoKnownId) {
	feed("LogLoad: LoadMap: /Game/Maps/Ministry/Ministry?Scenario=Scenario_Ministry_Checkpoint_Security");
	feed("LogGameplayEvents: Display: Round 1 started");
	feed("LogGameplayEvents: Display: Ghost[76561198000000009, team 0] killed Rifleman[INVALID, team 1] with BP_Firearm_M4A1_C_1");
	feed("LogNet: Player disconnected: Ghost");
	EXPECT_TRUE(tracker.sessions().empty());

	// Renamed before rejoining: the name is new, the id is not.
	feed("LogNet: Join succeeded: Ghost2");
	feed("LogEOSAntiCheat: Display: ServerRegisterClient: Client: (76561198000000009) Result: (EOS_Success)");

	ASSERT_EQ(tracker.sessions().size(), 1u);
	EXPECT_EQ(tracker.sessions().begin()->first, "id:76561198000000009");
}

TEST_F(MatchTrackerTest, ScenarioSnapshotOpensAndMissesCloseSession) {
	feed("LogLoad: LoadMap: /Game/Maps/Farmhouse/Farmhouse?Scenario=Scenario_Farmhouse_Checkpoint_Security");

	auto out = tracker.mergeSnapshot(snapshot({"Carol"}));
	ASSERT_EQ(out.sessionsOpened.size(), 1u);
	EXPECT_EQ(out.sessionsOpened[0].displayName, "Carol");
	const std::string carol = out.sessionsOpened[0].identity;

	out = tracker.mergeSnapshot(snapshot({}));
	EXPECT_TRUE(out.sessionsClosed.empty());
	EXPECT_EQ(tracker.sessions().at(carol).snapshotMisses, 1);

	out = tracker.mergeSnapshot(snapshot({}));
	EXPECT_TRUE(out.sessionsClosed.empty());

	out = tracker.mergeSnapshot(snapshot({}));
	ASSERT_EQ(out.sessionsClosed.size(), 1u);
	EXPECT_EQ(out.sessionsClosed[0].identity, carol);
	EXPECT_TRUE(tracker.sessions().empty());
}

TEST_F(MatchTrackerTest, SnapshotPresenceResetsMissCount) {
	feed("LogLoad: LoadMap: /Game/Maps/Farmhouse/Farmhouse?Scenario=Scenario_Farmhouse_Checkpoint_Security");
	tracker.mergeSnapshot(snapshot({"Carol"}));
	tracker.mergeSnapshot(snapshot({}));
	tracker.mergeSnapshot(snapshot({}));
	tracker.mergeSnapshot(snapshot({"Carol"}));
	tracker.mergeSnapshot(snapshot({}));
	const auto out = tracker.mergeSnapshot(snapshot({}));
	EXPECT_TRUE(out.sessionsClosed.empty());
	EXPECT_EQ(tracker.sessions().size(), 1u);
}

TEST_F(MatchTrackerTest, SnapshotMatchesLogSessionByName) {
	feed("LogLoad: LoadMap: /Game/Maps/Farmhouse/Farmhouse?Scenario=Scenario_Farmhouse_Checkpoint_Security");
	feed("LogGameplayEvents: Display: Round 1 started");
	feed("LogGameplayEvents: Display: " + kAlice + " killed Rifleman[INVALID, team 1] with BP_Firearm_M4A1_C_1");

	const auto out = tracker.mergeSnapshot(snapshot({"Alice"}));
	EXPECT_TRUE(out.sessionsOpened.empty());
	EXPECT_EQ(tracker.sessions().size(), 1u);
	EXPECT_EQ(tracker.sessions().count("id:76561198000000001"), 1u);
}

TEST_F(MatchTrackerTest, UnreachableSnapshotChangesNothing) {
	feed("LogLoad: LoadMap: /Game/Maps/Farmhouse/Farmhouse?Scenario=Scenario_Farmhouse_Checkpoint_Security");
	tracker.mergeSnapshot(snapshot({"Carol"}));

	for (int i = 0; i < 5; ++i) {
		Core::LiveSnapshot down;
		down.serverId = tracker.serverId();
		down.queriedAt = now();
		down.reachable = false;
		down.error = "timeout";
		EXPECT_TRUE(tracker.mergeSnapshot(down).empty());
	}
	EXPECT_EQ(tracker.sessions().size(), 1u);
}

TEST_F(MatchTrackerTest, GameOverThenMapChangeClosesEverything) {
	feed("LogLoad: LoadMap: /Game/Maps/Hideout/Hideout?Scenario=Scenario_Hideout_Checkpoint_Security");
	feed("LogNet: Join succeeded: Alice");
	feed("LogGameplayEvents: Display: Round 1 started");
	feed("LogSession: Display: AINSGameSession::HandleMatchHasEnded");

	EXPECT_EQ(tracker.phase(), MatchState::RoundEnd);
	EXPECT_TRUE(tracker.currentMatch()->gameOver);
	EXPECT_EQ(tracker.currentMatch()->roundsPlayed, 1);
	const std::string first = tracker.currentMatch()->matchId;

	const auto out = feed("LogLoad: LoadMap: /Game/Maps/Precinct/Precinct?Scenario=Scenario_Precinct_Push_Security");
	ASSERT_EQ(out.matchesClosed.size(), 1u);
	EXPECT_EQ(out.matchesClosed[0].matchId, first);
	EXPECT_EQ(out.matchesClosed[0].state, MatchState::Concluded);
	EXPECT_TRUE(out.matchesClosed[0].endedAt.has_value());
	EXPECT_EQ(out.sessionsClosed.size(), 1u);
	EXPECT_EQ(tracker.phase(), MatchState::Warmup);
}

TEST_F(MatchTrackerTest, RestoredMatchContinuesInNextTracker) {
	feed("LogNet: Join succeeded: Alice");
	feed("LogNet: Join succeeded: Bob");
	feed("LogGameplayEvents: Display: Round 1 started");
	ASSERT_TRUE(tracker.currentMatch().has_value());
	const Core::MatchRecord saved = *tracker.currentMatch();
	std::vector<Core::PlayerSession> open;
	for (const auto& entry : tracker.sessions()) {
		open.push_back(entry.second);
	}
	ASSERT_EQ(open.size(), 2u);

	Tracking::MatchTracker next{"hardcore-1"};
	ASSERT_TRUE(next.restore(saved, open));
	EXPECT_EQ(next.phase(), MatchState::RoundActive);
	EXPECT_EQ(next.sessions().size(), 2u);
	EXPECT_FALSE(next.restore(saved, open));

	auto out = feed(next, "LogGameplayEvents: Display: " + kAlice + " killed " + kBob + " with BP_Firearm_AK74_C_2147480339 (headshot)");
	EXPECT_TRUE(out.matchesOpened.empty());
	ASSERT_EQ(out.batches.size(), 1u);
	EXPECT_EQ(out.batches[0].deltas[0].matchId, saved.matchId);
	EXPECT_FALSE(out.batches[0].deltas[0].outOfRound);

	feed(next, "LogGameplayEvents: Display: Round 1 Over: Team 0 won (win reason: Elimination)");
	out = feed(next, "LogLoad: LoadMap: /Game/Maps/Farmhouse/Farmhouse?Scenario=Scenario_Farmhouse_Push_Security?Lighting=Night");
	ASSERT_EQ(out.matchesClosed.size(), 1u);
	EXPECT_EQ(out.matchesClosed[0].matchId, saved.matchId);
	EXPECT_EQ(out.matchesClosed[0].roundsPlayed, 1);
	EXPECT_EQ(out.matchesOpened.size(), 1u);
	EXPECT_EQ(out.sessionsClosed.size(), 2u);
}

TEST_F(MatchTrackerTest, RestoreRefusesConcludedOrForeignMatch) {
	Core::MatchRecord record;
	record.matchId = "hardcore-1:1759613400000";
	record.serverId = "hardcore-1";
	record.state = MatchState::Concluded;
	EXPECT_FALSE(tracker.restore(record, {}));

	record.state = MatchState::Warmup;
	record.serverId = "hardcore-2";
	EXPECT_FALSE(tracker.restore(record, {}));
	EXPECT_EQ(tracker.phase(), MatchState::Idle);
}

TEST_F(MatchTrackerTest, BacklogDisconnectAfterSnapshotKeepsLogTime) {
	feed("LogLoad: LoadMap: /Game/Maps/Farmhouse/Farmhouse?Scenario=Scenario_Farmhouse_Checkpoint_Security");
	const auto logTime = *tracker.lastLogTime();

	// Query answered now while the tailer is still replaying old lines.
	Core::LiveSnapshot live;
	live.serverId = tracker.serverId();
	live.queriedAt = Utils::now();
	live.reachable = true;
	Core::SnapshotPlayer carol;
	carol.name = "Carol";
	live.players.push_back(carol);

	auto out = tracker.mergeSnapshot(live);
	ASSERT_EQ(out.sessionsOpened.size(), 1u);
	EXPECT_EQ(out.sessionsOpened[0].joinedAt, logTime);

	out = feed("LogNet: Player disconnected: Carol");
	ASSERT_EQ(out.sessionsClosed.size(), 1u);
	const auto& closed = out.sessionsClosed[0];
	ASSERT_TRUE(closed.leftAt.has_value());
	EXPECT_GE(*closed.leftAt, closed.joinedAt);
	EXPECT_EQ(*closed.leftAt, *tracker.lastLogTime());

	const auto* identity = tracker.resolver().identity(closed.identity);
	ASSERT_NE(identity, nullptr);
	EXPECT_LE(identity->lastSeen, *tracker.lastLogTime());
}

TEST_F(MatchTrackerTest, ConnectedPlayersCarryIntoNextMatch) {
	feed("LogLoad: LoadMap: /Game/Maps/Hideout/Hideout?Scenario=Scenario_Hideout_Checkpoint_Security");
	feed("LogNet: Join succeeded: Alice");
	feed("LogNet: Join succeeded: Bob");
	const auto out = feed("LogLoad: LoadMap: /Game/Maps/Precinct/Precinct?Scenario=Scenario_Precinct_Push_Security");

	EXPECT_EQ(out.sessionsClosed.size(), 2u);
	ASSERT_EQ(out.sessionsOpened.size(), 2u);
	EXPECT_EQ(out.sessionsOpened[0].matchId, out.matchesOpened[0].matchId);
}

TEST_F(MatchTrackerTest, UnrecognizedLinesAreCounted) {
	feed("LogStreaming: Display: nothing to see");
	feed("not even a prefix");
	EXPECT_EQ(tracker.counters().unrecognized, 2u);
	EXPECT_EQ(tracker.counters().events, 2u);
	EXPECT_EQ(tracker.phase(), MatchState::Idle);
}
