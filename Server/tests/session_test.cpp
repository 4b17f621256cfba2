#include "test_support.hpp"
#include "account/Account.hpp"
#include "world/Dispatcher.hpp"
#include "world/Session.hpp"
#include <doctest/doctest.h>
#include <map>
#include <memory>

using namespace std;

namespace
{
	struct SessionTest
	{
		SessionTest()
			: world(seed_world(), "alamo_plaza"), dispatcher(world), router(world)
			, svc{ world, dispatcher, router, accounts, store }
		{
			accounts.passwords = { { "alice", "secret" }, { "bob", "hunter2" } };
		}

		struct Client
		{
			shared_ptr<RecordingOutbox> out = make_shared<RecordingOutbox>();
			unique_ptr<Session> session;
		};

		Client connect(SessionId id)
		{
			Client c;
			c.session = make_unique<Session>(id, svc, c.out);
			c.session->open();
			return c;
		}

		void login(Client& c, const string& name, const string& password)
		{
			c.session->on_line("login");
			c.session->on_line(name);
			c.session->on_line(password);
		}

		World world;
		Dispatcher dispatcher;
		BroadcastRouter router;
		FakeAccounts accounts;
		FakeStore store;
		Services svc;
	};
}

TEST_CASE_FIXTURE(SessionTest, "Session: welcome then login flow")
{
	auto c = connect(1);
	CHECK_EQ(c.session->state(), SessionState::CONNECTED);
	CHECK(c.out->saw("Welcome to the San Antonio MUD"));

	CHECK(c.session->on_line("login"));
	CHECK_EQ(c.session->state(), SessionState::AUTHENTICATING);
	CHECK_EQ(c.session->auth_step(), AuthStep::LOGIN_USERNAME);
	CHECK_EQ(c.out->lines().back(), "Username:");

	CHECK(c.session->on_line("alice"));
	CHECK_EQ(c.session->auth_step(), AuthStep::LOGIN_PASSWORD);
	CHECK_EQ(c.out->lines().back(), "Password:");

	CHECK(c.session->on_line("secret"));
	CHECK_EQ(c.session->state(), SessionState::ACTIVE);
	CHECK_EQ(c.session->username(), "alice");
	CHECK(c.out->saw("Welcome back, alice!"));
	CHECK(c.out->saw("The Alamo Plaza"));
	CHECK_EQ(world.who(), vector<string>{ "alice" });
}

TEST_CASE_FIXTURE(SessionTest, "Session: signup creates account and enters world")
{
	auto c = connect(1);
	c.session->on_line("signup");
	CHECK_EQ(c.out->lines().back(), "Choose a username:");
	c.session->on_line("carol");
	CHECK_EQ(c.out->lines().back(), "Choose a password:");
	c.session->on_line("pw");

	CHECK_EQ(c.session->state(), SessionState::ACTIVE);
	CHECK(c.out->saw("Account created! Welcome to the San Antonio MUD, carol!"));
	CHECK_EQ(accounts.passwords["carol"], "pw");
}

TEST_CASE_FIXTURE(SessionTest, "Session: bad password returns to connected")
{
	auto c = connect(1);
	login(c, "alice", "wrong");
	CHECK_EQ(c.session->state(), SessionState::CONNECTED);
	CHECK(c.out->saw("Login failed: Invalid username or password"));
	CHECK(world.who().empty());

	login(c, "alice", "secret");
	CHECK_EQ(c.session->state(), SessionState::ACTIVE);
}

TEST_CASE_FIXTURE(SessionTest, "Session: game commands refused before login")
{
	auto c = connect(1);
	CHECK(c.session->on_line("look"));
	CHECK_EQ(c.out->lines().back(), "You must log in first. Type 'login' to sign in or 'signup' to create an account.");
	CHECK_EQ(c.session->state(), SessionState::CONNECTED);
}

TEST_CASE_FIXTURE(SessionTest, "Session: quit before login closes")
{
	auto c = connect(1);
	CHECK_FALSE(c.session->on_line("quit"));
	CHECK_EQ(c.out->lines().back(), "Goodbye!");
	c.session->on_disconnect();
	CHECK_EQ(c.session->state(), SessionState::CLOSED);
	CHECK(store.locations.empty());
}

TEST_CASE_FIXTURE(SessionTest, "Session: quit at password prompt is a password")
{
	auto c = connect(1);
	c.session->on_line("login");
	c.session->on_line("alice");
	CHECK(c.session->on_line("quit"));
	CHECK_EQ(c.session->state(), SessionState::CONNECTED);
	CHECK(c.out->saw("Login failed"));
}

TEST_CASE_FIXTURE(SessionTest, "Session: second login of same account is refused")
{
	auto first = connect(1);
	login(first, "alice", "secret");
	auto second = connect(2);
	login(second, "alice", "secret");

	CHECK_EQ(second.session->state(), SessionState::CONNECTED);
	CHECK(second.out->saw("That account is already logged in."));
	auto holder = world.session_of("alice");
	REQUIRE(holder.has_value());
	CHECK_EQ(*holder, 1u);
}

TEST_CASE_FIXTURE(SessionTest, "Session: others see arrival and departure")
{
	auto a = connect(1);
	login(a, "alice", "secret");
	auto b = connect(2);
	login(b, "bob", "hunter2");

	CHECK(a.out->saw("bob has entered the game."));
	CHECK_FALSE(b.out->saw("bob has entered the game."));

	CHECK_FALSE(b.session->on_line("quit"));
	CHECK(b.out->saw("Goodbye! Your progress has been saved."));
	b.session->on_disconnect();
	CHECK(a.out->saw("bob has left the game."));
	CHECK_EQ(world.who(), vector<string>{ "alice" });
}

TEST_CASE_FIXTURE(SessionTest, "Session: disconnect saves room and carried items")
{
	auto c = connect(1);
	login(c, "alice", "secret");
	c.session->on_line("get brochure");
	c.session->on_line("east");

	c.session->on_disconnect();
	c.session->on_disconnect();

	CHECK_EQ(c.session->state(), SessionState::CLOSED);
	CHECK_EQ(store.locations["alice"], "riverwalk_north");
	REQUIRE(store.items.count("alamo_brochure"));
	CHECK_EQ(store.items["alamo_brochure"], (ItemOwner{ OwnerKind::CARRIER, "alice" }));
	CHECK(world.who().empty());
	CHECK_EQ(router.attached(), 0u);
	CHECK(world.check_invariants().empty());
}

TEST_CASE_FIXTURE(SessionTest, "Session: returning player starts where they left")
{
	accounts.rooms["alice"] = "pearl";
	auto c = connect(1);
	login(c, "alice", "secret");
	CHECK_EQ(world.room_of(1), "pearl");
	CHECK(c.out->saw("Chef Isabella"));
}

TEST_CASE_FIXTURE(SessionTest, "Session: lines after quit are ignored")
{
	auto c = connect(1);
	login(c, "alice", "secret");
	CHECK_FALSE(c.session->on_line("quit"));
	CHECK_EQ(c.session->state(), SessionState::DISCONNECTING);
	CHECK_FALSE(c.session->on_line("look"));
}

TEST_CASE_FIXTURE(SessionTest, "Session: login with a name goes straight to the password")
{
	auto c = connect(1);
	CHECK(c.session->on_line("login alice"));
	CHECK_EQ(c.session->state(), SessionState::AUTHENTICATING);
	CHECK_EQ(c.session->auth_step(), AuthStep::LOGIN_PASSWORD);
	CHECK_EQ(c.out->lines().back(), "Password:");
	CHECK_FALSE(c.out->saw("You are already logged in."));

	CHECK(c.session->on_line("secret"));
	CHECK_EQ(c.session->state(), SessionState::ACTIVE);
	CHECK_EQ(c.session->username(), "alice");
}

TEST_CASE_FIXTURE(SessionTest, "Session: signup with a name shows the welcome guide")
{
	auto c = connect(1);
	CHECK(c.session->on_line("SIGNUP carol"));
	CHECK_EQ(c.session->auth_step(), AuthStep::SIGNUP_PASSWORD);
	CHECK_EQ(c.out->lines().back(), "Choose a password:");

	CHECK(c.session->on_line("pw"));
	CHECK_EQ(c.session->state(), SessionState::ACTIVE);
	CHECK(c.out->saw("=== WELCOME GUIDE ==="));
	CHECK(c.out->saw("The Alamo Plaza"));
	CHECK_EQ(accounts.passwords["carol"], "pw");
}

TEST_CASE_FIXTURE(SessionTest, "Session: returning login skips the welcome guide")
{
	auto c = connect(1);
	login(c, "alice", "secret");
	CHECK(c.out->saw("Type 'help' to see available commands"));
	CHECK_FALSE(c.out->saw("=== WELCOME GUIDE ==="));
}

TEST_CASE_FIXTURE(SessionTest, "Session: login is refused once logged in")
{
	auto c = connect(1);
	login(c, "alice", "secret");
	CHECK(c.session->on_line("login bob"));
	CHECK_EQ(c.out->lines().back(), "You are already logged in.");
	CHECK_EQ(c.session->state(), SessionState::ACTIVE);
}
