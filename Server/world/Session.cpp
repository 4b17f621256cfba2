#include "Session.hpp"
#include "World.hpp"
#include "Dispatcher.hpp"
#include "BroadcastRouter.hpp"
#include "../account/Account.hpp"
#include "../common/common.hpp"
#include "../common/net.hpp"

using namespace std;

const char* state_name(SessionState s)
{
	switch (s)
	{
	case SessionState::CONNECTED: return "CONNECTED";
	case SessionState::AUTHENTICATING: return "AUTHENTICATING";
	case SessionState::ACTIVE: return "ACTIVE";
	case SessionState::DISCONNECTING: return "DISCONNECTING";
	case SessionState::CLOSED: return "CLOSED";
	}
	return "UNKNOWN";
}

namespace
{
	string welcome_guide(const string& roomName)
	{
		return
			"=== WELCOME GUIDE ===\n"
			"You're now in " + roomName + ". Here are some basic commands to get started:\n"
			"\n"
			"Exploring:\n"
			"  'look' - See your surroundings, exits, people, and items\n"
			"  'n/s/e/w' - Move north/south/east/west\n"
			"  'where' - Check your current location\n"
			"\n"
			"Communication:\n"
			"  'say <message>' - Talk to people in the same room\n"
			"  'shout <message>' - Send message to everyone in the world\n"
			"  'who' - See who's online\n"
			"\n"
			"Items:\n"
			"  'get <item>' - Pick up items you find\n"
			"  'drop <item>' - Drop items from your inventory\n"
			"  'inventory' (or 'inv') - See what you're carrying\n"
			"\n"
			"NPCs:\n"
			"  'talk <npc>' - Chat with characters (try keywords!)\n"
			"\n"
			"Need help? Type 'help' anytime!\n"
			"==================";
	}
}

Session::Session(SessionId id, Services& svc, weak_ptr<Outbox> out)
	: id_(id), svc_(svc), out_(move(out))
{
}

void Session::open()
{
	if (auto out = out_.lock())
		svc_.router.attach(id_, out);
	send("Welcome to the San Antonio MUD\nType 'login' to sign in or 'signup' to create a new account");
}

void Session::send(const string& text)
{
	auto out = out_.lock();
	if (!out)
		return;
	if (!out->push_line(text))
	{
		common::warn("SESSION", "session " + to_string(id_) + " output queue full, closing");
		out->close();
	}
}

bool Session::on_line(const string& raw)
{
	string line = common::trim(raw);
	switch (state_)
	{
	case SessionState::CONNECTED:
		handle_connected(line);
		return state_ != SessionState::DISCONNECTING;
	case SessionState::AUTHENTICATING:
		handle_auth(line);
		return state_ != SessionState::DISCONNECTING;
	case SessionState::ACTIVE:
		break;
	case SessionState::DISCONNECTING:
	case SessionState::CLOSED:
		return false;
	}

	Reply reply = svc_.dispatcher.dispatch(id_, true, line);
	for (const auto& l : reply.lines)
		send(l);
	svc_.router.publish_all(reply.events);
	if (reply.quit)
	{
		state_ = SessionState::DISCONNECTING;
		return false;
	}
	return true;
}

void Session::handle_connected(const string& line)
{
	auto [word, rest] = net::split_verb(line);
	if (word.empty())
		return;

	// "login alice" skips the username prompt
	switch (Dispatcher::parse_verb(word))
	{
	case Verb::LOGIN:
		state_ = SessionState::AUTHENTICATING;
		start_auth(AuthStep::LOGIN_USERNAME, rest);
		return;
	case Verb::SIGNUP:
		state_ = SessionState::AUTHENTICATING;
		start_auth(AuthStep::SIGNUP_USERNAME, rest);
		return;
	case Verb::QUIT:
		send("Goodbye!");
		state_ = SessionState::DISCONNECTING;
		return;
	default:
		break;
	}

	// help works before login, game commands are refused with a pointer to login/signup
	Reply reply = svc_.dispatcher.dispatch(id_, false, line);
	for (const auto& l : reply.lines)
		send(l);
}

void Session::start_auth(AuthStep usernameStep, const string& username)
{
	bool login = usernameStep == AuthStep::LOGIN_USERNAME;
	if (username.empty())
	{
		step_ = usernameStep;
		send(login ? "Username:" : "Choose a username:");
		return;
	}
	pending_name_ = username;
	step_ = login ? AuthStep::LOGIN_PASSWORD : AuthStep::SIGNUP_PASSWORD;
	send(login ? "Password:" : "Choose a password:");
}

void Session::handle_auth(const string& line)
{
	switch (step_)
	{
	case AuthStep::LOGIN_USERNAME:
	case AuthStep::SIGNUP_USERNAME:
	{
		if (common::lower(line) == "quit")
		{
			send("Goodbye!");
			state_ = SessionState::DISCONNECTING;
			return;
		}
		start_auth(step_, line);
		return;
	}
	case AuthStep::LOGIN_PASSWORD:
	{
		auto acc = svc_.accounts.login(pending_name_, line);
		pending_name_.clear();
		if (!acc.ok())
		{
			common::log("SESSION", "login failed for " + acc.username);
			state_ = SessionState::CONNECTED;
			step_ = AuthStep::NONE;
			send(string("Login failed: ") + describe(acc.error) + "\nType 'login' to try again or 'signup' to create account");
			return;
		}
		activate(acc, false);
		return;
	}
	case AuthStep::SIGNUP_PASSWORD:
	{
		auto acc = svc_.accounts.signup(pending_name_, line);
		pending_name_.clear();
		if (!acc.ok())
		{
			state_ = SessionState::CONNECTED;
			step_ = AuthStep::NONE;
			send(string("Signup failed: ") + describe(acc.error) + "\nType 'signup' to try again or 'login' to sign in");
			return;
		}
		activate(acc, true);
		return;
	}
	case AuthStep::NONE:
		state_ = SessionState::CONNECTED;
		handle_connected(line);
		return;
	}
}

void Session::activate(const AccountResult& acc, bool fresh)
{
	step_ = AuthStep::NONE;
	auto reg = svc_.world.register_session(id_, acc.username, acc.roomId);
	if (!reg.ok())
	{
		common::log("SESSION", "refused second session for " + acc.username);
		state_ = SessionState::CONNECTED;
		send("That account is already logged in.\nType 'login' to try again or 'signup' to create account");
		return;
	}

	username_ = acc.username;
	state_ = SessionState::ACTIVE;
	common::log("SESSION", "session " + to_string(id_) + " is " + username_ + " in " + reg.value.roomId);

	if (fresh)
		send("Account created! Welcome to the San Antonio MUD, " + username_ + "!\n\n" + welcome_guide(reg.value.name));
	else
		send("Welcome back, " + username_ + "!\nType 'help' to see available commands");
	send("\n" + Dispatcher::render_room(reg.value));
	svc_.router.publish(Event::room(reg.value.roomId, username_ + " has entered the game.", id_));
}

void Session::on_disconnect()
{
	teardown();
}

void Session::teardown()
{
	if (state_ == SessionState::CLOSED)
		return;

	bool was_active = !username_.empty();
	state_ = SessionState::DISCONNECTING;
	svc_.router.detach(id_);

	if (was_active)
	{
		auto last = svc_.world.unregister_session(id_);
		if (last.ok())
		{
			try
			{
				svc_.store.persist_location(username_, last.value);
				svc_.store.persist_items(svc_.world.carried_by(username_));
			}
			catch (const runtime_error& ex)
			{
				common::warn("SESSION", "could not save " + username_ + ": " + ex.what());
			}
			svc_.router.publish(Event::room(last.value, username_ + " has left the game."));
			common::log("SESSION", username_ + " left from " + last.value);
		}
	}
	state_ = SessionState::CLOSED;
}
