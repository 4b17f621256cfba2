#pragma once
#include "Room.hpp"
#include "Event.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

enum class WorldError
{
	NONE,
	NO_SUCH_EXIT,
	NOT_AUTHENTICATED,
	NOT_FOUND,
	AMBIGUOUS,
	NO_SUCH_NPC,
	NOT_IN_ROOM,
	NO_SUCH_PLAYER,
	ALREADY_ONLINE,
	NO_SUCH_ROOM
};

const char* error_name(WorldError e);

// Raised when the model finds itself in a state correct locking cannot produce.
// Always thrown before the offending operation touches anything.
class InvariantViolation : public logic_error
{
public:
	using logic_error::logic_error;
};

template <typename T>
struct Result
{
	WorldError error = WorldError::NONE;
	T value{};
	vector<string> candidates; // AMBIGUOUS matches, or the exits on NO_SUCH_EXIT

	bool ok() const { return error == WorldError::NONE; }

	static Result success(T v)
	{
		Result r;
		r.value = move(v);
		return r;
	}
	static Result fail(WorldError e, vector<string> c = {})
	{
		Result r;
		r.error = e;
		r.candidates = move(c);
		return r;
	}
};

struct Thing
{
	string id;
	string name;
	string description;
};

struct RoomView
{
	string roomId;
	string name;
	string description;
	vector<string> exits;
	vector<string> others; // players, requester excluded
	vector<Thing> npcs;
	vector<Thing> items;
};

struct MoveResult
{
	string fromRoom;
	string toRoom;
	string direction;
	RoomView view;
};

struct Chat
{
	Event event;
	size_t audience = 0; // sessions other than the speaker that will hear it
};

struct Dialogue
{
	string npcName;
	string keyword;
	string line;
	string roomId;
};

class World
{
public:
	World(WorldData data, string startRoom);

	// session registry
	Result<RoomView> register_session(SessionId id, const string& username, const string& roomId);
	Result<string> unregister_session(SessionId id);

	// player operations
	Result<MoveResult> move(SessionId actor, const string& direction);
	Result<RoomView> look_at(SessionId actor) const;
	Result<string> where(SessionId actor) const;
	Result<Chat> say(SessionId actor, const string& text) const;
	Result<Event> shout(SessionId actor, const string& text) const;
	Result<Chat> emote(SessionId actor, const string& text) const;
	Result<Event> whisper(SessionId actor, const string& target, const string& text) const;
	Result<Thing> take_item(SessionId actor, const string& nameFragment);
	Result<Thing> drop_item(SessionId actor, const string& nameFragment);
	Result<vector<Thing>> inventory(SessionId actor) const;
	Result<Dialogue> talk(SessionId actor, const string& npcFragment, const string& keyword);
	vector<string> who() const;

	// scheduler
	vector<Event> tick_advance_npcs(mt19937& rng, int percent);

	// router lookups, evaluated at call time
	vector<SessionId> sessions_in_room(const string& roomId) const;
	vector<SessionId> online_sessions() const;
	optional<SessionId> session_of(const string& username) const;
	string username_of(SessionId id) const;
	string room_of(SessionId id) const;

	// persistence snapshots
	vector<pair<string, string>> player_locations() const;
	vector<ItemPlacement> item_placements() const;
	vector<ItemPlacement> carried_by(const string& username) const;

	// inspection
	string start_room() const { return start_room_; }
	bool has_room(const string& roomId) const;
	string npc_room(const string& npcId) const;
	optional<ItemOwner> item_owner(const string& itemId) const;
	vector<string> check_invariants() const;

	static string normalize_direction(const string& direction);

private:
	struct Player
	{
		SessionId id = 0;
		string username;
		string roomId;
		set<string> inventory;
	};

	const Player* find_player(SessionId id) const;
	Room& room(const string& roomId);
	const Room& room(const string& roomId) const;
	RoomView view_of(const Room& r, SessionId viewer) const;
	vector<SessionId> others_in(const Room& r, SessionId except) const;
	Result<string> match(const string& fragment, const vector<pair<string, string>>& pool) const;

private:
	mutable mutex mu_;

	unordered_map<string, Room> rooms_;   // roomId, Room
	map<string, Npc> npcs_;               // npcId, Npc
	map<string, Item> items_;             // itemId, Item
	map<SessionId, Player> players_;      // sessionId, Player
	unordered_map<string, SessionId> by_name_;
	vector<SessionId> login_order_;

	string start_room_;
};
