#pragma once
#include "Room.hpp"
#include <memory>
#include <string>

using namespace std;

class World;
class Dispatcher;
class BroadcastRouter;
class Outbox;
class AccountService;
class LocationStore;
struct AccountResult;

enum class SessionState
{
	CONNECTED, AUTHENTICATING, ACTIVE, DISCONNECTING, CLOSED
};

enum class AuthStep
{
	NONE, LOGIN_USERNAME, LOGIN_PASSWORD, SIGNUP_USERNAME, SIGNUP_PASSWORD
};

const char* state_name(SessionState s);

// Everything a session talks to; owned by the server, outlives every session.
struct Services
{
	World& world;
	Dispatcher& dispatcher;
	BroadcastRouter& router;
	AccountService& accounts;
	LocationStore& store;
};

// One connected player, transport-free. The owner feeds it lines and tells it
// when the connection is gone; all calls for one session must be serialized.
class Session
{
public:
	Session(SessionId id, Services& svc, weak_ptr<Outbox> out);

	void open();
	bool on_line(const string& line);
	void on_disconnect();

	SessionId id() const { return id_; }
	SessionState state() const { return state_; }
	AuthStep auth_step() const { return step_; }
	const string& username() const { return username_; }

private:
	void send(const string& text);
	void handle_connected(const string& line);
	void handle_auth(const string& line);
	void start_auth(AuthStep usernameStep, const string& username);
	void activate(const AccountResult& acc, bool fresh);
	void teardown();

private:
	SessionId id_;
	Services& svc_;
	weak_ptr<Outbox> out_;

	SessionState state_ = SessionState::CONNECTED;
	AuthStep step_ = AuthStep::NONE;
	string pending_name_;
	string username_;
};
