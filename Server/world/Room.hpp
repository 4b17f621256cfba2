#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace std;

using SessionId = uint64_t;

class Room
{
public:
	string roomId;
	string name;
	string description;
	vector<pair<string, string>> exits; // direction, target roomId (load order)

	set<SessionId> players;
	set<string> npcs;
	set<string> items;

	const string* exit_to(const string& direction) const;
	vector<string> exit_names() const;
};

struct Npc
{
	string npcId;
	string name;
	string description;
	string roomId;
	map<string, string> responses; // keyword, line ("default" is the greeting)
	vector<string> wander;         // rooms it may walk between, empty = stationary

	bool stationary() const { return wander.size() < 2; }
	bool may_enter(const string& roomId) const;
};

enum class OwnerKind
{
	ROOM, CARRIER
};

struct ItemOwner
{
	OwnerKind kind = OwnerKind::ROOM;
	string id; // roomId or username

	bool operator==(const ItemOwner&) const = default;
};

struct Item
{
	string itemId;
	string name;
	string description;
	ItemOwner owner;
};

struct ItemPlacement
{
	string itemId;
	ItemOwner owner;
};

// what the persistence layer hands over at startup
struct WorldData
{
	vector<Room> rooms;
	vector<Npc> npcs;
	vector<Item> items;
};
