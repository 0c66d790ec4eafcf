#include "query/A2SProtocol.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace StatTrack;
using Query::Bytes;

namespace {

// A2S_INFO answer from a Linux dedicated server, game port in the EDF.
const Bytes kInfoResponse = {
	0xFF, 0xFF, 0xFF, 0xFF, 0x49,
	0x11,                                   // protocol 17
	'S', 'r', 'v', 0x00,                    // name
	'F', 'a', 'r', 'm', 0x00,               // map
	'i', 'n', 's', 0x00,                    // folder
	'I', 'n', 's', 0x00,                    // game
	0x00, 0x00,                             // app id
	0x05, 0x1C, 0x02,                       // players, max players, bots
	'd', 'l', 0x00, 0x01,                   // dedicated, linux, public, VAC
	'1', '.', '0', 0x00,                    // version
	0x80, 0x87, 0x69,                       // EDF: game port 27015
};

// A2S_PLAYER answer with three players.
const Bytes kPlayerResponse = {
	0xFF, 0xFF, 0xFF, 0xFF, 0x44,
	0x03,
	0x00, 'A', 'l', 'i', 'c', 'e', 0x00, 0x0A, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF1, 0x42,  // 10, 120.5s
	0x01, 'B', 'o', 'b', 0x00,           0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x70, 0x42,  // 3, 60s
	0x02, 'C', 'a', 'r', 'o', 'l', 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC0, 0x3F,  // 0, 1.5s
};

Bytes slice(const Bytes &b, std::size_t from, std::size_t to) {
	return Bytes(b.begin() + static_cast<std::ptrdiff_t>(from), b.begin() + static_cast<std::ptrdiff_t>(to));
}

// Source split header: FE FF FF FF | id (LE) | total | index | max size 1248.
Bytes fragment(std::uint32_t id, std::uint8_t total, std::uint8_t index, const Bytes &chunk) {
	Bytes out = {
		0xFE, 0xFF, 0xFF, 0xFF,
		static_cast<std::uint8_t>(id & 0xFF), static_cast<std::uint8_t>((id >> 8) & 0xFF),
		static_cast<std::uint8_t>((id >> 16) & 0xFF), static_cast<std::uint8_t>((id >> 24) & 0xFF),
		total, index,
		0xE0, 0x04,
	};
	out.insert(out.end(), chunk.begin(), chunk.end());
	return out;
}

std::optional<Bytes> feed(Query::FragmentAssembler &assembler, const Bytes &packet) {
	auto frag = Query::decodeSplitFragment(packet);
	EXPECT_TRUE(static_cast<bool>(frag)) << frag.error;
	if (!frag) {
		return std::nullopt;
	}
	return assembler.add(std::move(*frag.value));
}

void expectFarmInfo(const Core::ServerInfo &info) {
	EXPECT_EQ(info.protocol, 17);
	EXPECT_EQ(info.name, "Srv");
	EXPECT_EQ(info.map, "Farm");
	EXPECT_EQ(info.folder, "ins");
	EXPECT_EQ(info.game, "Ins");
	EXPECT_EQ(info.players, 5);
	EXPECT_EQ(info.maxPlayers, 28);
	EXPECT_EQ(info.bots, 2);
	EXPECT_EQ(info.serverType, 'd');
	EXPECT_EQ(info.environment, 'l');
	EXPECT_FALSE(info.passwordProtected);
	EXPECT_TRUE(info.vacSecured);
	EXPECT_EQ(info.version, "1.0");
	ASSERT_TRUE(info.gamePort.has_value());
	EXPECT_EQ(*info.gamePort, 27015);
	EXPECT_FALSE(info.steamId.has_value());
	EXPECT_FALSE(info.keywords.has_value());
}

} // namespace

TEST(A2SProtocolTest, InfoRequestMatchesWireFormat) {
	const Bytes expected = {
		0xFF, 0xFF, 0xFF, 0xFF, 0x54,
		'S', 'o', 'u', 'r', 'c', 'e', ' ', 'E', 'n', 'g', 'i', 'n', 'e', ' ',
		'Q', 'u', 'e', 'r', 'y', 0x00,
	};
	EXPECT_EQ(Query::encodeInfoRequest(), expected);

	Bytes withChallenge = expected;
	withChallenge.insert(withChallenge.end(), {0x4B, 0xA1, 0xD5, 0x22});
	EXPECT_EQ(Query::encodeInfoRequest(0x22D5A14B), withChallenge);
}

TEST(A2SProtocolTest, PlayerChallengeRoundTrip) {
	const Bytes first = {0xFF, 0xFF, 0xFF, 0xFF, 0x55, 0xFF, 0xFF, 0xFF, 0xFF};
	EXPECT_EQ(Query::encodePlayerRequest(), first);

	const Bytes challengeReply = {0xFF, 0xFF, 0xFF, 0xFF, 0x41, 0x4B, 0xA1, 0xD5, 0x22};
	EXPECT_EQ(Query::classify(challengeReply), Query::PacketKind::Challenge);

	const auto challenge = Query::decodeChallenge(challengeReply);
	ASSERT_TRUE(static_cast<bool>(challenge)) << challenge.error;
	EXPECT_EQ(*challenge.value, 0x22D5A14B);

	const Bytes second = {0xFF, 0xFF, 0xFF, 0xFF, 0x55, 0x4B, 0xA1, 0xD5, 0x22};
	EXPECT_EQ(Query::encodePlayerRequest(*challenge.value), second);
}

TEST(A2SProtocolTest, ShortChallengeIsMalformed) {
	const Bytes reply = {0xFF, 0xFF, 0xFF, 0xFF, 0x41, 0x4B, 0xA1};
	EXPECT_FALSE(static_cast<bool>(Query::decodeChallenge(reply)));
}

TEST(A2SProtocolTest, DecodesUnsplitInfoResponse) {
	EXPECT_EQ(Query::classify(kInfoResponse), Query::PacketKind::Info);
	const auto info = Query::decodeInfo(kInfoResponse);
	ASSERT_TRUE(static_cast<bool>(info)) << info.error;
	expectFarmInfo(*info.value);
}

TEST(A2SProtocolTest, TruncatedInfoIsMalformed) {
	const auto info = Query::decodeInfo(slice(kInfoResponse, 0, 20));
	EXPECT_FALSE(static_cast<bool>(info));
	EXPECT_FALSE(info.error.empty());
}

TEST(A2SProtocolTest, WrongOpcodeIsReported) {
	const auto players = Query::decodePlayers(kInfoResponse);
	ASSERT_FALSE(static_cast<bool>(players));
	EXPECT_NE(players.error.find("0x49"), std::string::npos);
}

TEST(A2SProtocolTest, SingleFragmentInfoResponse) {
	const Bytes packet = fragment(0x00000007, 1, 0, kInfoResponse);
	EXPECT_EQ(Query::classify(packet), Query::PacketKind::Split);

	Query::FragmentAssembler assembler(std::chrono::milliseconds(3000));
	const auto full = feed(assembler, packet);
	ASSERT_TRUE(full.has_value());
	EXPECT_EQ(*full, kInfoResponse);

	const auto info = Query::decodeInfo(*full);
	ASSERT_TRUE(static_cast<bool>(info)) << info.error;
	expectFarmInfo(*info.value);
	EXPECT_EQ(assembler.pendingSets(), 0u);
}

TEST(A2SProtocolTest, TwoFragmentInfoResponse) {
	const Bytes first = {
		0xFE, 0xFF, 0xFF, 0xFF, 0x78, 0x56, 0x34, 0x12, 0x02, 0x00, 0xE0, 0x04,
		0xFF, 0xFF, 0xFF, 0xFF, 0x49, 0x11, 'S', 'r', 'v', 0x00,
		'F', 'a', 'r', 'm', 0x00, 'i', 'n', 's', 0x00,
	};
	const Bytes second = {
		0xFE, 0xFF, 0xFF, 0xFF, 0x78, 0x56, 0x34, 0x12, 0x02, 0x01, 0xE0, 0x04,
		'I', 'n', 's', 0x00, 0x00, 0x00, 0x05, 0x1C, 0x02,
		'd', 'l', 0x00, 0x01, '1', '.', '0', 0x00, 0x80, 0x87, 0x69,
	};

	Query::FragmentAssembler assembler(std::chrono::milliseconds(3000));
	EXPECT_FALSE(feed(assembler, first).has_value());
	EXPECT_EQ(assembler.pendingSets(), 1u);

	const auto full = feed(assembler, second);
	ASSERT_TRUE(full.has_value());
	EXPECT_EQ(*full, kInfoResponse);

	const auto info = Query::decodeInfo(*full);
	ASSERT_TRUE(static_cast<bool>(info)) << info.error;
	expectFarmInfo(*info.value);
}

TEST(A2SProtocolTest, FivePlayerFragmentsOutOfOrderWithDuplicate) {
	ASSERT_EQ(kPlayerResponse.size(), 49u);
	const std::uint32_t id = 0x0BADF00D;
	std::vector<Bytes> parts;
	for (std::uint8_t i = 0; i < 5; ++i) {
		const std::size_t from = i * 10u;
		const std::size_t to = i == 4 ? kPlayerResponse.size() : from + 10u;
		parts.push_back(fragment(id, 5, i, slice(kPlayerResponse, from, to)));
	}

	Query::FragmentAssembler assembler(std::chrono::milliseconds(3000));
	EXPECT_FALSE(feed(assembler, parts[4]).has_value());
	EXPECT_FALSE(feed(assembler, parts[0]).has_value());
	EXPECT_FALSE(feed(assembler, parts[0]).has_value());
	EXPECT_FALSE(feed(assembler, parts[2]).has_value());
	EXPECT_FALSE(feed(assembler, parts[1]).has_value());

	const auto full = feed(assembler, parts[3]);
	ASSERT_TRUE(full.has_value());
	EXPECT_EQ(*full, kPlayerResponse);

	const auto players = Query::decodePlayers(*full);
	ASSERT_TRUE(static_cast<bool>(players)) << players.error;
	ASSERT_EQ(players.value->size(), 3u);
	EXPECT_EQ((*players.value)[0].name, "Alice");
	EXPECT_EQ((*players.value)[0].score, 10);
	EXPECT_FLOAT_EQ((*players.value)[0].durationSecs, 120.5f);
	EXPECT_EQ((*players.value)[1].name, "Bob");
	EXPECT_EQ((*players.value)[1].score, 3);
	EXPECT_FLOAT_EQ((*players.value)[1].durationSecs, 60.0f);
	EXPECT_EQ((*players.value)[2].name, "Carol");
	EXPECT_EQ((*players.value)[2].index, 2);
	EXPECT_FLOAT_EQ((*players.value)[2].durationSecs, 1.5f);
}

TEST(A2SProtocolTest, PlayerCountIsOnlyAHint) {
	Bytes response = kPlayerResponse;
	response[5] = 0x00;
	const auto players = Query::decodePlayers(response);
	ASSERT_TRUE(static_cast<bool>(players)) << players.error;
	EXPECT_EQ(players.value->size(), 3u);
}

TEST(A2SProtocolTest, TruncatedPlayerRecordIsDropped) {
	const auto players = Query::decodePlayers(slice(kPlayerResponse, 0, kPlayerResponse.size() - 3));
	ASSERT_TRUE(static_cast<bool>(players)) << players.error;
	ASSERT_EQ(players.value->size(), 2u);
	EXPECT_EQ((*players.value)[1].name, "Bob");
}

TEST(A2SProtocolTest, CompressedSplitResponseIsRejected) {
	const Bytes packet = fragment(0x80000001u, 2, 0, slice(kInfoResponse, 0, 10));
	const auto frag = Query::decodeSplitFragment(packet);
	EXPECT_FALSE(static_cast<bool>(frag));
	EXPECT_NE(frag.error.find("compressed"), std::string::npos);
}

TEST(A2SProtocolTest, FragmentIndexOutOfRangeIsRejected) {
	const Bytes packet = fragment(9, 2, 2, slice(kInfoResponse, 0, 10));
	EXPECT_FALSE(static_cast<bool>(Query::decodeSplitFragment(packet)));
}

TEST(A2SProtocolTest, IncompleteSetsExpire) {
	using Clock = Query::FragmentAssembler::Clock;
	Query::FragmentAssembler assembler(std::chrono::milliseconds(3000));

	const auto t0 = Clock::now();
	auto frag = Query::decodeSplitFragment(fragment(42, 2, 0, slice(kInfoResponse, 0, 20)));
	ASSERT_TRUE(static_cast<bool>(frag));
	EXPECT_FALSE(assembler.add(std::move(*frag.value), t0).has_value());

	EXPECT_EQ(assembler.expire(t0 + std::chrono::milliseconds(1000)), 0u);
	EXPECT_EQ(assembler.pendingSets(), 1u);
	EXPECT_EQ(assembler.expire(t0 + std::chrono::milliseconds(3000)), 1u);
	EXPECT_EQ(assembler.pendingSets(), 0u);

	// The late second half alone starts a new, incomplete set.
	auto late = Query::decodeSplitFragment(fragment(42, 2, 1, slice(kInfoResponse, 20, kInfoResponse.size())));
	ASSERT_TRUE(static_cast<bool>(late));
	EXPECT_FALSE(assembler.add(std::move(*late.value), t0 + std::chrono::milliseconds(3100)).has_value());
}

TEST(A2SProtocolTest, ClassifiesNoiseAsUnknown) {
	EXPECT_EQ(Query::classify(Bytes{0xFF, 0xFF}), Query::PacketKind::Unknown);
	EXPECT_EQ(Query::classify(Bytes{0x00, 0x00, 0x00, 0x00, 0x49}), Query::PacketKind::Unknown);
	EXPECT_EQ(Query::classify(Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0x6D}), Query::PacketKind::Unknown);
}
