#include "test_support.hpp"
#include <doctest/doctest.h>
#include <atomic>
#include <random>
#include <thread>

using namespace std;

namespace
{
	const vector<string> kDirections = { "north", "south", "east", "west" };

	WorldData apple_world()
	{
		WorldData w;
		w.rooms.push_back(test_room("orchard", "The Orchard", { { "north", "barn" } }));
		w.rooms.push_back(test_room("barn", "The Barn", { { "south", "orchard" } }));
		w.items.push_back(test_item("red", "red apple", "orchard"));
		w.items.push_back(test_item("green", "green apple", "orchard"));
		w.items.push_back(test_item("apple", "apple", "barn"));
		return w;
	}
}

TEST_CASE("World: seed world loads clean")
{
	World w(seed_world(), "alamo_plaza");
	for (const char* id : { "alamo_plaza", "riverwalk_north", "riverwalk_south", "pearl", "tower_americas", "mission_san_jose", "southtown" })
		CHECK(w.has_room(id));
	CHECK_EQ(w.npc_room("mariachi_carlos"), "riverwalk_north");
	CHECK(w.check_invariants().empty());
}

TEST_CASE("World: rejects exit to unknown room")
{
	WorldData d;
	d.rooms.push_back(test_room("a", "A", { { "north", "nowhere" } }));
	CHECK_THROWS_AS(World(move(d), "a"), runtime_error);
}

TEST_CASE("World: register places player and refuses second login")
{
	World w(seed_world(), "alamo_plaza");
	auto first = w.register_session(1, "alice", "pearl");
	REQUIRE(first.ok());
	CHECK_EQ(first.value.name, "The Pearl");

	auto again = w.register_session(2, "alice", "alamo_plaza");
	CHECK_EQ(again.error, WorldError::ALREADY_ONLINE);
	CHECK_EQ(w.room_of(1), "pearl");
	CHECK_EQ(w.who(), vector<string>{ "alice" });
}

TEST_CASE("World: unknown saved room falls back to start")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "demolished_hotel").ok());
	CHECK_EQ(w.room_of(1), "alamo_plaza");
}

TEST_CASE("World: move south then north returns home")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());

	auto down = w.move(1, "s");
	REQUIRE(down.ok());
	CHECK_EQ(down.value.fromRoom, "alamo_plaza");
	CHECK_EQ(down.value.toRoom, "southtown");
	CHECK_EQ(down.value.direction, "south");
	CHECK_EQ(w.sessions_in_room("alamo_plaza").size(), 0u);

	auto up = w.move(1, "North");
	REQUIRE(up.ok());
	CHECK_EQ(up.value.toRoom, "alamo_plaza");
	CHECK_EQ(w.sessions_in_room("alamo_plaza"), vector<SessionId>{ 1 });
}

TEST_CASE("World: move without exit lists exits")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());

	auto r = w.move(1, "north");
	CHECK_EQ(r.error, WorldError::NO_SUCH_EXIT);
	CHECK_EQ(r.candidates, (vector<string>{ "east", "south" }));
	CHECK_EQ(w.room_of(1), "alamo_plaza");
}

TEST_CASE("World: operations need a registered session")
{
	World w(seed_world(), "alamo_plaza");
	CHECK_EQ(w.move(9, "east").error, WorldError::NOT_AUTHENTICATED);
	CHECK_EQ(w.look_at(9).error, WorldError::NOT_AUTHENTICATED);
	CHECK_EQ(w.take_item(9, "brochure").error, WorldError::NOT_AUTHENTICATED);
}

TEST_CASE("World: take matches partial names ignoring case")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());

	auto r = w.take_item(1, "Historic Brochure");
	REQUIRE(r.ok());
	CHECK_EQ(r.value.id, "alamo_brochure");
	CHECK_EQ(*w.item_owner("alamo_brochure"), (ItemOwner{ OwnerKind::CARRIER, "alice" }));

	auto gone = w.take_item(1, "brochure");
	CHECK_EQ(gone.error, WorldError::NOT_FOUND);
	CHECK(gone.candidates.empty());
}

TEST_CASE("World: take by word prefix")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());
	auto r = w.take_item(1, "hist");
	REQUIRE(r.ok());
	CHECK_EQ(r.value.name, "a historic brochure");
}

TEST_CASE("World: ambiguous take lists candidates alphabetically")
{
	World w(apple_world(), "orchard");
	REQUIRE(w.register_session(1, "alice", "orchard").ok());

	auto r = w.take_item(1, "apple");
	CHECK_EQ(r.error, WorldError::AMBIGUOUS);
	CHECK_EQ(r.candidates, (vector<string>{ "green apple", "red apple" }));
	CHECK_EQ(w.item_owner("red")->kind, OwnerKind::ROOM);

	CHECK(w.take_item(1, "red").ok());
	CHECK(w.take_item(1, "apple").ok());
	CHECK_EQ(w.item_owner("green")->id, "alice");
}

TEST_CASE("World: exact name beats longer names")
{
	World w(apple_world(), "orchard");
	REQUIRE(w.register_session(1, "alice", "barn").ok());
	REQUIRE(w.move(1, "south").ok());
	REQUIRE(w.take_item(1, "red apple").ok());
	REQUIRE(w.move(1, "north").ok());
	REQUIRE(w.drop_item(1, "red").ok());

	auto r = w.take_item(1, "apple");
	REQUIRE(r.ok());
	CHECK_EQ(r.value.id, "apple");
}

TEST_CASE("World: drop returns item to current room")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());
	REQUIRE(w.take_item(1, "brochure").ok());
	REQUIRE(w.move(1, "east").ok());

	auto missing = w.drop_item(1, "guitar");
	CHECK_EQ(missing.error, WorldError::NOT_FOUND);
	CHECK_EQ(missing.candidates, vector<string>{ "a historic brochure" });

	REQUIRE(w.drop_item(1, "brochure").ok());
	CHECK_EQ(*w.item_owner("alamo_brochure"), (ItemOwner{ OwnerKind::ROOM, "riverwalk_north" }));
	CHECK(w.inventory(1).value.empty());
	CHECK(w.check_invariants().empty());
}

TEST_CASE("World: carried items survive logout")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());
	REQUIRE(w.take_item(1, "brochure").ok());

	auto last = w.unregister_session(1);
	REQUIRE(last.ok());
	CHECK_EQ(last.value, "alamo_plaza");
	CHECK_EQ(w.carried_by("alice").size(), 1u);
	CHECK(w.check_invariants().empty());

	REQUIRE(w.register_session(5, "alice", "alamo_plaza").ok());
	auto inv = w.inventory(5);
	REQUIRE_EQ(inv.value.size(), 1u);
	CHECK_EQ(inv.value[0].id, "alamo_brochure");
}

TEST_CASE("World: talk uses keyword then greeting")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());

	auto history = w.talk(1, "maria", "History");
	REQUIRE(history.ok());
	CHECK_NE(history.value.line.find("1836"), string::npos);
	CHECK_EQ(history.value.npcName, "Maria, the Tour Guide");

	auto partial = w.talk(1, "maria", "histor");
	REQUIRE(partial.ok());
	CHECK_EQ(partial.value.line, history.value.line);

	auto greeting = w.talk(1, "guide", "");
	REQUIRE(greeting.ok());
	CHECK_NE(greeting.value.line.find("Welcome to the Alamo"), string::npos);

	auto unknown = w.talk(1, "maria", "spaceships");
	REQUIRE(unknown.ok());
	CHECK_EQ(unknown.value.line, greeting.value.line);
}

TEST_CASE("World: talk distinguishes absent from unknown npc")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());

	auto away = w.talk(1, "carlos", "");
	CHECK_EQ(away.error, WorldError::NOT_IN_ROOM);
	CHECK_EQ(away.candidates, vector<string>{ "Maria, the Tour Guide" });

	CHECK_EQ(w.talk(1, "gandalf", "").error, WorldError::NO_SUCH_NPC);
}

TEST_CASE("World: npc without greeting does not understand")
{
	WorldData d;
	d.rooms.push_back(test_room("a", "A", {}));
	Npc n;
	n.npcId = "parrot";
	n.name = "Polly";
	n.roomId = "a";
	n.responses = { { "cracker", "Squawk!" } };
	d.npcs.push_back(n);

	World w(move(d), "a");
	REQUIRE(w.register_session(1, "alice", "a").ok());
	CHECK_EQ(w.talk(1, "polly", "cracker").value.line, "Squawk!");
	CHECK_EQ(w.talk(1, "polly", "weather").value.line, "Polly doesn't understand what you're asking about.");
}

TEST_CASE("World: who follows login order")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(3, "carol", "pearl").ok());
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());
	REQUIRE(w.register_session(2, "bob", "southtown").ok());
	CHECK_EQ(w.who(), (vector<string>{ "carol", "alice", "bob" }));

	REQUIRE(w.unregister_session(1).ok());
	CHECK_EQ(w.who(), (vector<string>{ "carol", "bob" }));
}

TEST_CASE("World: chat audience and whisper targets")
{
	World w(seed_world(), "alamo_plaza");
	REQUIRE(w.register_session(1, "alice", "alamo_plaza").ok());

	auto alone = w.say(1, "hello?");
	REQUIRE(alone.ok());
	CHECK_EQ(alone.value.audience, 0u);
	CHECK_EQ(alone.value.event.text, "[Room] alice: hello?");

	REQUIRE(w.register_session(2, "bob", "alamo_plaza").ok());
	CHECK_EQ(w.say(1, "hi bob").value.audience, 1u);
	CHECK_EQ(w.emote(1, "waves").value.event.text, "alice waves");

	auto whisper = w.whisper(1, "Bob", "psst");
	REQUIRE(whisper.ok());
	CHECK_EQ(whisper.value.scope, Scope::DIRECT);
	CHECK_EQ(whisper.value.target, 2u);
	CHECK_EQ(w.whisper(1, "carol", "psst").error, WorldError::NO_SUCH_PLAYER);

	CHECK_EQ(w.shout(2, "hey").value.scope, Scope::GLOBAL);
}

TEST_CASE("World: concurrent take hands item to exactly one player")
{
	World w(seed_world(), "alamo_plaza");
	const int players = 8;
	for (int i = 0; i < players; i++)
		REQUIRE(w.register_session(i + 1, "player" + to_string(i), "alamo_plaza").ok());

	atomic<int> winners{ 0 };
	vector<thread> ths;
	for (int i = 0; i < players; i++)
	{
		ths.emplace_back([&, i]
			{
				if (w.take_item(i + 1, "brochure").ok())
					winners++;
			});
	}
	for (auto& t : ths)
		t.join();

	CHECK_EQ(winners.load(), 1);
	CHECK_EQ(w.item_owner("alamo_brochure")->kind, OwnerKind::CARRIER);
	CHECK(w.check_invariants().empty());
}

TEST_CASE("World: concurrent moves keep occupancy consistent")
{
	World w(seed_world(), "alamo_plaza");
	const int players = 8;
	for (int i = 0; i < players; i++)
		REQUIRE(w.register_session(i + 1, "walker" + to_string(i), "alamo_plaza").ok());

	atomic<bool> broken{ false };
	vector<thread> ths;
	for (int i = 0; i < players; i++)
	{
		ths.emplace_back([&, i]
			{
				mt19937 rng(i);
				uniform_int_distribution<size_t> pick(0, kDirections.size() - 1);
				for (int step = 0; step < 500; step++)
				{
					w.move(i + 1, kDirections[pick(rng)]);
					if (i == 0 && step % 50 == 0 && !w.check_invariants().empty())
						broken = true;
				}
			});
	}
	for (auto& t : ths)
		t.join();

	CHECK_FALSE(broken.load());
	CHECK(w.check_invariants().empty());

	size_t placed = 0;
	for (const char* id : { "alamo_plaza", "riverwalk_north", "riverwalk_south", "pearl", "tower_americas", "mission_san_jose", "southtown" })
		placed += w.sessions_in_room(id).size();
	CHECK_EQ(placed, static_cast<size_t>(players));
}
