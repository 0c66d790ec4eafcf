#include "query/A2SClient.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "utils/Logger.hpp"

using namespace StatTrack;
using Query::Bytes;

namespace {

const Bytes kChallenge = {0xFF, 0xFF, 0xFF, 0xFF, 0x41, 0x4B, 0xA1, 0xD5, 0x22};
const std::int32_t kChallengeValue = 0x22D5A14B;

const Bytes kInfo = {
	0xFF, 0xFF, 0xFF, 0xFF, 0x49, 0x11,
	'S', 'r', 'v', 0x00, 'F', 'a', 'r', 'm', 0x00, 'i', 'n', 's', 0x00, 'I', 'n', 's', 0x00,
	0x00, 0x00, 0x05, 0x1C, 0x00, 'd', 'l', 0x00, 0x01, '1', '.', '0', 0x00,
};

const Bytes kPlayers = {
	0xFF, 0xFF, 0xFF, 0xFF, 0x44, 0x02,
	0x00, 'A', 'l', 'i', 'c', 'e', 0x00, 0x0A, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF1, 0x42,
	0x01, 'B', 'o', 'b', 0x00, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x70, 0x42,
};

/// Game server double: answers each datagram through a script.
struct ScriptedServer {
	std::function<std::vector<Bytes>(const Bytes &)> respond;
	std::mutex mutex;
	std::vector<Bytes> sent;
	std::deque<Bytes> inbox;

	std::size_t sentCount() {
		std::lock_guard<std::mutex> lock(mutex);
		return sent.size();
	}
};

class FakeTransport : public Query::DatagramTransport {
public:
	explicit FakeTransport(std::shared_ptr<ScriptedServer> server) : m_server(std::move(server)) {}

	bool send(const Bytes &packet, std::string &) override {
		std::vector<Bytes> replies = m_server->respond ? m_server->respond(packet) : std::vector<Bytes>{};
		std::lock_guard<std::mutex> lock(m_server->mutex);
		m_server->sent.push_back(packet);
		for (auto &r : replies) {
			m_server->inbox.push_back(std::move(r));
		}
		return true;
	}

	Query::RecvStatus receive(Bytes &out, std::chrono::milliseconds timeout, std::string &) override {
		{
			std::lock_guard<std::mutex> lock(m_server->mutex);
			if (!m_server->inbox.empty()) {
				out = std::move(m_server->inbox.front());
				m_server->inbox.pop_front();
				return Query::RecvStatus::Ok;
			}
		}
		std::this_thread::sleep_for(timeout);
		return Query::RecvStatus::Timeout;
	}

private:
	std::shared_ptr<ScriptedServer> m_server;
};

Query::TransportFactory fakeFactory(std::shared_ptr<ScriptedServer> server) {
	return [server](const std::string &, std::string &) -> std::unique_ptr<Query::DatagramTransport> {
		return std::make_unique<FakeTransport>(server);
	};
}

bool isPlayerRequest(const Bytes &p) { return p.size() == 9 && p[4] == Query::A2S::kPlayerRequest; }
bool isInfoRequest(const Bytes &p) { return p.size() >= 25 && p[4] == Query::A2S::kInfoRequest; }

bool carriesChallenge(const Bytes &p) {
	return p.size() >= 4 && p[p.size() - 4] == 0x4B && p[p.size() - 3] == 0xA1 &&
	       p[p.size() - 2] == 0xD5 && p[p.size() - 1] == 0x22;
}

// Challenge-then-answer server, like current Source builds.
std::vector<Bytes> modernServer(const Bytes &request) {
	if (isInfoRequest(request)) {
		return {request.size() == 29 && carriesChallenge(request) ? kInfo : kChallenge};
	}
	if (isPlayerRequest(request)) {
		return {carriesChallenge(request) ? kPlayers : kChallenge};
	}
	return {};
}

Bytes split(std::uint32_t id, std::uint8_t total, std::uint8_t index, const Bytes &whole, std::size_t from, std::size_t to) {
	Bytes out = {0xFE, 0xFF, 0xFF, 0xFF,
	             static_cast<std::uint8_t>(id & 0xFF), static_cast<std::uint8_t>((id >> 8) & 0xFF),
	             static_cast<std::uint8_t>((id >> 16) & 0xFF), static_cast<std::uint8_t>((id >> 24) & 0xFF),
	             total, index, 0xE0, 0x04};
	out.insert(out.end(), whole.begin() + static_cast<std::ptrdiff_t>(from), whole.begin() + static_cast<std::ptrdiff_t>(to));
	return out;
}

} // namespace

class A2SClientTest : public ::testing::Test {
protected:
	void SetUp() override {
		Utils::getLogger().setConsoleEnabled(false);
		server = std::make_shared<ScriptedServer>();
		options.timeout = std::chrono::milliseconds(60);
		options.maxRetries = 2;
		options.backoff = std::chrono::milliseconds(5);
	}

	void TearDown() override {
		Utils::getLogger().setConsoleEnabled(true);
	}

	std::unique_ptr<Query::A2SClient> makeClient() {
		return std::make_unique<Query::A2SClient>("hardcore-1", "127.0.0.1:27131", options, fakeFactory(server));
	}

	std::shared_ptr<ScriptedServer> server;
	Query::QueryOptions options;
};

TEST_F(A2SClientTest, ChallengeIsEchoedForInfoAndPlayers) {
	server->respond = modernServer;
	const Core::LiveSnapshot snap = makeClient()->query();

	ASSERT_TRUE(snap.reachable) << snap.error;
	EXPECT_EQ(snap.serverId, "hardcore-1");
	ASSERT_TRUE(snap.info.has_value());
	EXPECT_EQ(snap.info->map, "Farm");
	ASSERT_EQ(snap.players.size(), 2u);
	EXPECT_EQ(snap.players[0].name, "Alice");
	EXPECT_EQ(snap.players[1].score, 3);

	ASSERT_EQ(server->sent.size(), 4u);
	EXPECT_EQ(server->sent[0], Query::encodeInfoRequest());
	EXPECT_EQ(server->sent[1], Query::encodeInfoRequest(kChallengeValue));
	EXPECT_EQ(server->sent[2], Query::encodePlayerRequest());
	EXPECT_EQ(server->sent[3], Query::encodePlayerRequest(kChallengeValue));
}

TEST_F(A2SClientTest, DirectPlayerAnswerWithoutChallengeIsAccepted) {
	options.queryInfo = false;
	server->respond = [](const Bytes &request) -> std::vector<Bytes> {
		return isPlayerRequest(request) ? std::vector<Bytes>{kPlayers} : std::vector<Bytes>{};
	};

	const auto snap = makeClient()->query();
	ASSERT_TRUE(snap.reachable) << snap.error;
	EXPECT_FALSE(snap.info.has_value());
	EXPECT_EQ(snap.players.size(), 2u);
	EXPECT_EQ(server->sent.size(), 1u);
}

TEST_F(A2SClientTest, SplitPlayerAnswerIsReassembled) {
	options.queryInfo = false;
	server->respond = [](const Bytes &request) -> std::vector<Bytes> {
		if (!isPlayerRequest(request)) {
			return {};
		}
		if (!carriesChallenge(request)) {
			return {kChallenge};
		}
		return {split(77, 2, 1, kPlayers, 20, kPlayers.size()), split(77, 2, 0, kPlayers, 0, 20)};
	};

	const auto snap = makeClient()->query();
	ASSERT_TRUE(snap.reachable) << snap.error;
	ASSERT_EQ(snap.players.size(), 2u);
	EXPECT_EQ(snap.players[1].name, "Bob");
}

TEST_F(A2SClientTest, StalePacketsAreIgnoredWhileWaiting) {
	options.queryInfo = false;
	server->respond = [](const Bytes &request) -> std::vector<Bytes> {
		if (!carriesChallenge(request)) {
			return {kChallenge};
		}
		return {kInfo, Bytes{0x01, 0x02}, kPlayers};
	};

	const auto snap = makeClient()->query();
	ASSERT_TRUE(snap.reachable) << snap.error;
	EXPECT_EQ(snap.players.size(), 2u);
}

TEST_F(A2SClientTest, SilentServerIsUnreachableAfterBoundedRetries) {
	server->respond = [](const Bytes &) { return std::vector<Bytes>{}; };

	auto client = makeClient();
	const auto snap = client->query();

	EXPECT_FALSE(snap.reachable);
	EXPECT_TRUE(snap.players.empty());
	EXPECT_NE(snap.error.find("timeout"), std::string::npos) << snap.error;
	// One request plus maxRetries retries; players are not asked once info timed out.
	EXPECT_EQ(server->sent.size(), 1u + static_cast<std::size_t>(options.maxRetries));
}

TEST_F(A2SClientTest, RetriesCountAttemptsNotChallengeResends) {
	options.queryInfo = false;
	// Hands out challenges but never the answer.
	server->respond = [](const Bytes &request) -> std::vector<Bytes> {
		return carriesChallenge(request) ? std::vector<Bytes>{} : std::vector<Bytes>{kChallenge};
	};

	auto client = makeClient();
	std::string err;
	auto transport = fakeFactory(server)("ignored", err);
	const auto result = client->queryPlayers(*transport);

	EXPECT_EQ(result.status, Query::QueryStatus::Timeout);
	EXPECT_EQ(result.attempts, 3);
	// First attempt: request + echo; later attempts already know the challenge.
	EXPECT_EQ(server->sent.size(), 4u);
}

TEST_F(A2SClientTest, EndlessChallengesAreMalformed) {
	options.queryInfo = false;
	options.maxRetries = 0;
	server->respond = [](const Bytes &) { return std::vector<Bytes>{kChallenge}; };

	const auto snap = makeClient()->query();
	EXPECT_FALSE(snap.reachable);
	EXPECT_EQ(snap.error.rfind("malformed", 0), 0u) << snap.error;
}

TEST_F(A2SClientTest, UndecodableAnswerConsumesRetries) {
	options.queryInfo = false;
	server->respond = [](const Bytes &) {
		return std::vector<Bytes>{Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0x44}};
	};

	auto client = makeClient();
	std::string err;
	auto transport = fakeFactory(server)("ignored", err);
	const auto result = client->queryPlayers(*transport);

	EXPECT_EQ(result.status, Query::QueryStatus::Malformed);
	EXPECT_EQ(result.attempts, 3);
	EXPECT_FALSE(result.error.empty());
}

TEST_F(A2SClientTest, UndecodableInfoStillQueriesPlayers) {
	server->respond = [](const Bytes &request) -> std::vector<Bytes> {
		if (isInfoRequest(request)) {
			return {Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0x49, 0x11}};
		}
		return {kPlayers};
	};
	options.maxRetries = 0;

	const auto snap = makeClient()->query();
	ASSERT_TRUE(snap.reachable) << snap.error;
	EXPECT_FALSE(snap.info.has_value());
	EXPECT_EQ(snap.players.size(), 2u);
}

TEST_F(A2SClientTest, TransportFailureIsUnreachable) {
	Query::A2SClient client("coop", "nowhere", options,
	                        [](const std::string &, std::string &err) -> std::unique_ptr<Query::DatagramTransport> {
		                        err = "cannot resolve nowhere";
		                        return nullptr;
	                        });

	const auto snap = client.query();
	EXPECT_FALSE(snap.reachable);
	EXPECT_EQ(snap.error, "cannot resolve nowhere");
}

TEST_F(A2SClientTest, CancelAbandonsInFlightQuery) {
	options.timeout = std::chrono::milliseconds(10000);
	server->respond = [](const Bytes &) { return std::vector<Bytes>{}; };

	auto client = makeClient();
	std::atomic<bool> cancel{false};
	std::thread canceller([&cancel] {
		std::this_thread::sleep_for(std::chrono::milliseconds(150));
		cancel.store(true);
	});

	const auto started = std::chrono::steady_clock::now();
	const auto snap = client->query(&cancel);
	const auto elapsed = std::chrono::steady_clock::now() - started;
	canceller.join();

	EXPECT_FALSE(snap.reachable);
	EXPECT_NE(snap.error.find("cancelled"), std::string::npos) << snap.error;
	EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}

TEST(A2SAddressTest, SplitsHostAndPort) {
	const auto v4 = Query::splitHostPort("10.0.0.5:27131");
	ASSERT_TRUE(v4.has_value());
	EXPECT_EQ(v4->first, "10.0.0.5");
	EXPECT_EQ(v4->second, "27131");

	const auto v6 = Query::splitHostPort("[::1]:27015");
	ASSERT_TRUE(v6.has_value());
	EXPECT_EQ(v6->first, "::1");

	EXPECT_FALSE(Query::splitHostPort("example.org").has_value());
	EXPECT_FALSE(Query::splitHostPort("example.org:0").has_value());
	EXPECT_FALSE(Query::splitHostPort("example.org:99999").has_value());
	EXPECT_FALSE(Query::splitHostPort(":27015").has_value());
}
