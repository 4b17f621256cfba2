#include "World.hpp"
#include "../common/common.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace std;

const char* error_name(WorldError e)
{
	switch (e)
	{
	case WorldError::NONE: return "NONE";
	case WorldError::NO_SUCH_EXIT: return "NO_SUCH_EXIT";
	case WorldError::NOT_AUTHENTICATED: return "NOT_AUTHENTICATED";
	case WorldError::NOT_FOUND: return "NOT_FOUND";
	case WorldError::AMBIGUOUS: return "AMBIGUOUS";
	case WorldError::NO_SUCH_NPC: return "NO_SUCH_NPC";
	case WorldError::NOT_IN_ROOM: return "NOT_IN_ROOM";
	case WorldError::NO_SUCH_PLAYER: return "NO_SUCH_PLAYER";
	case WorldError::ALREADY_ONLINE: return "ALREADY_ONLINE";
	case WorldError::NO_SUCH_ROOM: return "NO_SUCH_ROOM";
	}
	return "UNKNOWN";
}

namespace
{
	bool word_prefix(const string& name, const string& fragment)
	{
		if (name.rfind(fragment, 0) == 0)
			return true;
		for (size_t i = 0; i < name.size(); i++)
		{
			if ((name[i] == ' ' || name[i] == '-') && name.compare(i + 1, fragment.size(), fragment) == 0)
				return true;
		}
		return false;
	}

	string owner_text(const ItemOwner& o)
	{
		return (o.kind == OwnerKind::ROOM ? "room:" : "carrier:") + o.id;
	}
}

World::World(WorldData data, string startRoom)
	: start_room_(std::move(startRoom))
{
	for (auto& r : data.rooms)
	{
		r.players.clear();
		r.npcs.clear();
		r.items.clear();
		string id = r.roomId;
		if (!rooms_.emplace(id, std::move(r)).second)
			throw runtime_error("duplicate room " + id);
	}
	if (!rooms_.count(start_room_))
		throw runtime_error("start room " + start_room_ + " does not exist");

	for (const auto& [id, r] : rooms_)
	{
		for (const auto& [dir, target] : r.exits)
		{
			if (!rooms_.count(target))
				throw runtime_error("room " + id + " exit " + dir + " leads to unknown room " + target);
		}
	}

	for (auto& n : data.npcs)
	{
		if (!rooms_.count(n.roomId))
			throw runtime_error("npc " + n.npcId + " placed in unknown room " + n.roomId);
		for (const auto& w : n.wander)
		{
			if (!rooms_.count(w))
				throw runtime_error("npc " + n.npcId + " may wander to unknown room " + w);
		}
		if (!n.stationary() && !n.may_enter(n.roomId))
			throw runtime_error("npc " + n.npcId + " starts outside its wander rooms");

		rooms_.at(n.roomId).npcs.insert(n.npcId);
		string id = n.npcId;
		if (!npcs_.emplace(id, std::move(n)).second)
			throw runtime_error("duplicate npc " + id);
	}

	for (auto& it : data.items)
	{
		if (it.owner.kind == OwnerKind::ROOM)
		{
			if (!rooms_.count(it.owner.id))
				throw runtime_error("item " + it.itemId + " placed in unknown room " + it.owner.id);
			rooms_.at(it.owner.id).items.insert(it.itemId);
		}
		string id = it.itemId;
		if (!items_.emplace(id, std::move(it)).second)
			throw runtime_error("duplicate item " + id);
	}

	common::log("WORLD", "loaded " + to_string(rooms_.size()) + " rooms, " + to_string(npcs_.size()) +
		" npcs, " + to_string(items_.size()) + " items");
}

string World::normalize_direction(const string& direction)
{
	string d = common::lower(common::trim(direction));
	if (d == "n") return "north";
	if (d == "s") return "south";
	if (d == "e") return "east";
	if (d == "w") return "west";
	return d;
}

const World::Player* World::find_player(SessionId id) const
{
	auto it = players_.find(id);
	return it == players_.end() ? nullptr : &it->second;
}

Room& World::room(const string& roomId)
{
	auto it = rooms_.find(roomId);
	if (it == rooms_.end())
		throw InvariantViolation("reference to unknown room " + roomId);
	return it->second;
}

const Room& World::room(const string& roomId) const
{
	auto it = rooms_.find(roomId);
	if (it == rooms_.end())
		throw InvariantViolation("reference to unknown room " + roomId);
	return it->second;
}

vector<SessionId> World::others_in(const Room& r, SessionId except) const
{
	vector<SessionId> out;
	for (auto id : r.players)
	{
		if (id != except)
			out.push_back(id);
	}
	return out;
}

RoomView World::view_of(const Room& r, SessionId viewer) const
{
	RoomView v;
	v.roomId = r.roomId;
	v.name = r.name;
	v.description = r.description;
	v.exits = r.exit_names();

	// login order keeps the listing stable between looks
	for (auto id : login_order_)
	{
		if (id != viewer && r.players.count(id))
			v.others.push_back(players_.at(id).username);
	}
	for (const auto& npcId : r.npcs)
	{
		const Npc& n = npcs_.at(npcId);
		v.npcs.push_back({ n.npcId, n.name, n.description });
	}
	for (const auto& itemId : r.items)
	{
		const Item& it = items_.at(itemId);
		v.items.push_back({ it.itemId, it.name, it.description });
	}
	return v;
}

// exact name > name or word starts with fragment > fragment anywhere in name
Result<string> World::match(const string& fragment, const vector<pair<string, string>>& pool) const
{
	string f = common::lower(common::trim(fragment));
	if (f.empty())
		return Result<string>::fail(WorldError::NOT_FOUND);

	vector<const pair<string, string>*> tiers[3];
	for (const auto& entry : pool)
	{
		string n = common::lower(entry.second);
		if (n == f)
			tiers[0].push_back(&entry);
		else if (word_prefix(n, f))
			tiers[1].push_back(&entry);
		else if (n.find(f) != string::npos)
			tiers[2].push_back(&entry);
	}

	for (auto& tier : tiers)
	{
		if (tier.empty())
			continue;
		if (tier.size() == 1)
			return Result<string>::success(tier.front()->first);

		sort(tier.begin(), tier.end(), [](auto a, auto b)
			{
				string la = common::lower(a->second), lb = common::lower(b->second);
				return la != lb ? la < lb : a->first < b->first;
			});
		vector<string> names;
		for (auto e : tier)
			names.push_back(e->second);
		return Result<string>::fail(WorldError::AMBIGUOUS, std::move(names));
	}
	return Result<string>::fail(WorldError::NOT_FOUND);
}

Result<RoomView> World::register_session(SessionId id, const string& username, const string& roomId)
{
	lock_guard<mutex> lk(mu_);
	if (by_name_.count(username) || players_.count(id))
		return Result<RoomView>::fail(WorldError::ALREADY_ONLINE);

	string target = rooms_.count(roomId) ? roomId : start_room_;
	if (target != roomId)
		common::warn("WORLD", username + " saved in unknown room '" + roomId + "', using " + target);

	Player p;
	p.id = id;
	p.username = username;
	p.roomId = target;
	for (const auto& [itemId, it] : items_)
	{
		if (it.owner.kind == OwnerKind::CARRIER && it.owner.id == username)
			p.inventory.insert(itemId);
	}

	room(target).players.insert(id);
	players_.emplace(id, std::move(p));
	by_name_.emplace(username, id);
	login_order_.push_back(id);

	return Result<RoomView>::success(view_of(room(target), id));
}

Result<string> World::unregister_session(SessionId id)
{
	lock_guard<mutex> lk(mu_);
	auto it = players_.find(id);
	if (it == players_.end())
		return Result<string>::fail(WorldError::NOT_AUTHENTICATED);

	string last = it->second.roomId;
	room(last).players.erase(id);
	by_name_.erase(it->second.username);
	login_order_.erase(remove(login_order_.begin(), login_order_.end(), id), login_order_.end());
	players_.erase(it);
	// carried items keep their CARRIER owner until the player returns
	return Result<string>::success(last);
}

Result<MoveResult> World::move(SessionId actor, const string& direction)
{
	lock_guard<mutex> lk(mu_);
	auto it = players_.find(actor);
	if (it == players_.end())
		return Result<MoveResult>::fail(WorldError::NOT_AUTHENTICATED);
	Player& p = it->second;

	string dir = normalize_direction(direction);
	Room& from = room(p.roomId);
	const string* target = from.exit_to(dir);
	if (!target)
		return Result<MoveResult>::fail(WorldError::NO_SUCH_EXIT, from.exit_names());

	Room& to = room(*target);
	if (!from.players.count(actor))
		throw InvariantViolation(p.username + " is not listed in " + from.roomId);

	from.players.erase(actor);
	to.players.insert(actor);
	p.roomId = to.roomId;

	MoveResult mr;
	mr.fromRoom = from.roomId;
	mr.toRoom = to.roomId;
	mr.direction = dir;
	mr.view = view_of(to, actor);
	return Result<MoveResult>::success(std::move(mr));
}

Result<RoomView> World::look_at(SessionId actor) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<RoomView>::fail(WorldError::NOT_AUTHENTICATED);
	return Result<RoomView>::success(view_of(room(p->roomId), actor));
}

Result<string> World::where(SessionId actor) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<string>::fail(WorldError::NOT_AUTHENTICATED);
	return Result<string>::success(room(p->roomId).name);
}

Result<Chat> World::say(SessionId actor, const string& text) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<Chat>::fail(WorldError::NOT_AUTHENTICATED);

	Chat c;
	c.event = Event::room(p->roomId, "[Room] " + p->username + ": " + text, actor);
	c.audience = others_in(room(p->roomId), actor).size();
	return Result<Chat>::success(std::move(c));
}

Result<Event> World::shout(SessionId actor, const string& text) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<Event>::fail(WorldError::NOT_AUTHENTICATED);
	return Result<Event>::success(Event::global("[Global] " + p->username + ": " + text));
}

Result<Chat> World::emote(SessionId actor, const string& text) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<Chat>::fail(WorldError::NOT_AUTHENTICATED);

	Chat c;
	c.event = Event::room(p->roomId, p->username + " " + text, actor);
	c.audience = others_in(room(p->roomId), actor).size();
	return Result<Chat>::success(std::move(c));
}

Result<Event> World::whisper(SessionId actor, const string& target, const string& text) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<Event>::fail(WorldError::NOT_AUTHENTICATED);

	auto it = by_name_.find(common::lower(common::trim(target)));
	if (it == by_name_.end())
		return Result<Event>::fail(WorldError::NO_SUCH_PLAYER);
	return Result<Event>::success(Event::direct(it->second, "[Whisper] " + p->username + ": " + text));
}

Result<Thing> World::take_item(SessionId actor, const string& nameFragment)
{
	lock_guard<mutex> lk(mu_);
	auto pit = players_.find(actor);
	if (pit == players_.end())
		return Result<Thing>::fail(WorldError::NOT_AUTHENTICATED);
	Player& p = pit->second;
	Room& r = room(p.roomId);

	vector<pair<string, string>> pool;
	for (const auto& itemId : r.items)
		pool.emplace_back(itemId, items_.at(itemId).name);

	auto found = match(nameFragment, pool);
	if (!found.ok())
	{
		if (found.error == WorldError::NOT_FOUND)
		{
			vector<string> here;
			for (const auto& e : pool)
				here.push_back(e.second);
			return Result<Thing>::fail(WorldError::NOT_FOUND, std::move(here));
		}
		return Result<Thing>::fail(found.error, std::move(found.candidates));
	}

	Item& it = items_.at(found.value);
	if (!(it.owner == ItemOwner{ OwnerKind::ROOM, r.roomId }))
		throw InvariantViolation("item " + it.itemId + " listed in " + r.roomId + " but owned by " + owner_text(it.owner));

	r.items.erase(it.itemId);
	p.inventory.insert(it.itemId);
	it.owner = { OwnerKind::CARRIER, p.username };
	return Result<Thing>::success({ it.itemId, it.name, it.description });
}

Result<Thing> World::drop_item(SessionId actor, const string& nameFragment)
{
	lock_guard<mutex> lk(mu_);
	auto pit = players_.find(actor);
	if (pit == players_.end())
		return Result<Thing>::fail(WorldError::NOT_AUTHENTICATED);
	Player& p = pit->second;
	Room& r = room(p.roomId);

	vector<pair<string, string>> pool;
	for (const auto& itemId : p.inventory)
		pool.emplace_back(itemId, items_.at(itemId).name);

	auto found = match(nameFragment, pool);
	if (!found.ok())
	{
		if (found.error == WorldError::NOT_FOUND)
		{
			vector<string> carried;
			for (const auto& e : pool)
				carried.push_back(e.second);
			return Result<Thing>::fail(WorldError::NOT_FOUND, std::move(carried));
		}
		return Result<Thing>::fail(found.error, std::move(found.candidates));
	}

	Item& it = items_.at(found.value);
	if (!(it.owner == ItemOwner{ OwnerKind::CARRIER, p.username }))
		throw InvariantViolation("item " + it.itemId + " carried by " + p.username + " but owned by " + owner_text(it.owner));

	p.inventory.erase(it.itemId);
	r.items.insert(it.itemId);
	it.owner = { OwnerKind::ROOM, r.roomId };
	return Result<Thing>::success({ it.itemId, it.name, it.description });
}

Result<vector<Thing>> World::inventory(SessionId actor) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<vector<Thing>>::fail(WorldError::NOT_AUTHENTICATED);

	vector<Thing> out;
	for (const auto& itemId : p->inventory)
	{
		const Item& it = items_.at(itemId);
		out.push_back({ it.itemId, it.name, it.description });
	}
	return Result<vector<Thing>>::success(std::move(out));
}

Result<Dialogue> World::talk(SessionId actor, const string& npcFragment, const string& keyword)
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(actor);
	if (!p)
		return Result<Dialogue>::fail(WorldError::NOT_AUTHENTICATED);
	const Room& r = room(p->roomId);

	vector<pair<string, string>> here;
	for (const auto& npcId : r.npcs)
		here.emplace_back(npcId, npcs_.at(npcId).name);

	auto found = match(npcFragment, here);
	if (found.error == WorldError::AMBIGUOUS)
		return Result<Dialogue>::fail(WorldError::AMBIGUOUS, std::move(found.candidates));
	if (!found.ok())
	{
		vector<pair<string, string>> everywhere;
		for (const auto& [npcId, n] : npcs_)
			everywhere.emplace_back(npcId, n.name);

		vector<string> names;
		for (const auto& e : here)
			names.push_back(e.second);

		auto elsewhere = match(npcFragment, everywhere);
		if (elsewhere.ok() || elsewhere.error == WorldError::AMBIGUOUS)
			return Result<Dialogue>::fail(WorldError::NOT_IN_ROOM, std::move(names));
		return Result<Dialogue>::fail(WorldError::NO_SUCH_NPC, std::move(names));
	}

	const Npc& n = npcs_.at(found.value);
	string kw = common::lower(common::trim(keyword));

	const string* line = nullptr;
	if (!kw.empty())
	{
		auto exact = n.responses.find(kw);
		if (exact != n.responses.end() && exact->first != "default")
			line = &exact->second;
		for (auto it = n.responses.begin(); !line && it != n.responses.end(); ++it)
		{
			if (it->first == "default")
				continue;
			if (it->first.find(kw) != string::npos || kw.find(it->first) != string::npos)
				line = &it->second;
		}
	}

	Dialogue d;
	d.npcName = n.name;
	d.keyword = kw;
	d.roomId = r.roomId;
	if (line)
	{
		d.line = *line;
	}
	else
	{
		auto greeting = n.responses.find("default");
		d.line = greeting != n.responses.end() ? greeting->second
			: n.name + " doesn't understand what you're asking about.";
	}
	return Result<Dialogue>::success(std::move(d));
}

vector<string> World::who() const
{
	lock_guard<mutex> lk(mu_);
	vector<string> out;
	out.reserve(login_order_.size());
	for (auto id : login_order_)
		out.push_back(players_.at(id).username);
	return out;
}

vector<Event> World::tick_advance_npcs(mt19937& rng, int percent)
{
	lock_guard<mutex> lk(mu_);
	uniform_int_distribution<int> roll(0, 99);

	struct Step
	{
		Npc* npc;
		string direction;
		string to;
	};

	// pick and check every move first, so a bad NPC abandons the whole tick untouched
	vector<Step> steps;
	for (auto& [npcId, n] : npcs_)
	{
		if (n.stationary())
			continue;
		if (roll(rng) >= percent)
			continue;

		const Room& from = room(n.roomId);
		if (!from.npcs.count(npcId))
			throw InvariantViolation(npcId + " is not listed in " + from.roomId);

		vector<pair<string, string>> ways; // direction, target
		for (const auto& [dir, target] : from.exits)
		{
			if (target != from.roomId && n.may_enter(target))
				ways.emplace_back(dir, target);
		}
		if (ways.empty())
			continue;

		uniform_int_distribution<size_t> pick(0, ways.size() - 1);
		const auto& way = ways[pick(rng)];
		room(way.second); // throws on an unknown target
		steps.push_back({ &n, way.first, way.second });
	}

	vector<Event> events;
	for (const auto& st : steps)
	{
		Room& from = room(st.npc->roomId);
		Room& to = room(st.to);
		from.npcs.erase(st.npc->npcId);
		to.npcs.insert(st.npc->npcId);
		st.npc->roomId = to.roomId;

		events.push_back(Event::room(from.roomId, st.npc->name + " wanders " + st.direction + " toward " + to.name + "."));
		events.push_back(Event::room(to.roomId, st.npc->name + " arrives from " + from.name + "."));
	}
	return events;
}

vector<SessionId> World::sessions_in_room(const string& roomId) const
{
	lock_guard<mutex> lk(mu_);
	auto it = rooms_.find(roomId);
	if (it == rooms_.end())
		return {};
	return vector<SessionId>(it->second.players.begin(), it->second.players.end());
}

vector<SessionId> World::online_sessions() const
{
	lock_guard<mutex> lk(mu_);
	return login_order_;
}

optional<SessionId> World::session_of(const string& username) const
{
	lock_guard<mutex> lk(mu_);
	auto it = by_name_.find(username);
	if (it == by_name_.end())
		return nullopt;
	return it->second;
}

string World::username_of(SessionId id) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(id);
	return p ? p->username : "";
}

string World::room_of(SessionId id) const
{
	lock_guard<mutex> lk(mu_);
	const Player* p = find_player(id);
	return p ? p->roomId : "";
}

vector<pair<string, string>> World::player_locations() const
{
	lock_guard<mutex> lk(mu_);
	vector<pair<string, string>> out;
	for (auto id : login_order_)
	{
		const Player& p = players_.at(id);
		out.emplace_back(p.username, p.roomId);
	}
	return out;
}

vector<ItemPlacement> World::item_placements() const
{
	lock_guard<mutex> lk(mu_);
	vector<ItemPlacement> out;
	for (const auto& [itemId, it] : items_)
		out.push_back({ itemId, it.owner });
	return out;
}

vector<ItemPlacement> World::carried_by(const string& username) const
{
	lock_guard<mutex> lk(mu_);
	vector<ItemPlacement> out;
	for (const auto& [itemId, it] : items_)
	{
		if (it.owner.kind == OwnerKind::CARRIER && it.owner.id == username)
			out.push_back({ itemId, it.owner });
	}
	return out;
}

bool World::has_room(const string& roomId) const
{
	lock_guard<mutex> lk(mu_);
	return rooms_.count(roomId) > 0;
}

string World::npc_room(const string& npcId) const
{
	lock_guard<mutex> lk(mu_);
	auto it = npcs_.find(npcId);
	return it == npcs_.end() ? "" : it->second.roomId;
}

optional<ItemOwner> World::item_owner(const string& itemId) const
{
	lock_guard<mutex> lk(mu_);
	auto it = items_.find(itemId);
	if (it == items_.end())
		return nullopt;
	return it->second.owner;
}

vector<string> World::check_invariants() const
{
	lock_guard<mutex> lk(mu_);
	vector<string> bad;

	// (a) and (d) for players
	for (const auto& [id, p] : players_)
	{
		auto rit = rooms_.find(p.roomId);
		if (rit == rooms_.end())
		{
			bad.push_back("(a) " + p.username + " in unknown room " + p.roomId);
			continue;
		}
		if (!rit->second.players.count(id))
			bad.push_back("(d) " + p.username + " missing from " + p.roomId);
	}

	// (b)
	if (by_name_.size() != players_.size() || login_order_.size() != players_.size())
		bad.push_back("(b) registry sizes disagree");
	for (const auto& [name, id] : by_name_)
	{
		auto pit = players_.find(id);
		if (pit == players_.end() || pit->second.username != name)
			bad.push_back("(b) " + name + " maps to a stale session");
	}

	// (d) occupant sets point back
	for (const auto& [roomId, r] : rooms_)
	{
		for (auto id : r.players)
		{
			auto pit = players_.find(id);
			if (pit == players_.end() || pit->second.roomId != roomId)
				bad.push_back("(d) session " + to_string(id) + " listed in " + roomId);
		}
		for (const auto& npcId : r.npcs)
		{
			auto nit = npcs_.find(npcId);
			if (nit == npcs_.end() || nit->second.roomId != roomId)
				bad.push_back("(d) npc " + npcId + " listed in " + roomId);
		}
		for (const auto& itemId : r.items)
		{
			auto iit = items_.find(itemId);
			if (iit == items_.end() || !(iit->second.owner == ItemOwner{ OwnerKind::ROOM, roomId }))
				bad.push_back("(c) item " + itemId + " listed in " + roomId);
		}
	}
	for (const auto& [npcId, n] : npcs_)
	{
		auto rit = rooms_.find(n.roomId);
		if (rit == rooms_.end() || !rit->second.npcs.count(npcId))
			bad.push_back("(d) npc " + npcId + " missing from " + n.roomId);
	}

	// (c) exactly one owner
	for (const auto& [itemId, it] : items_)
	{
		int holders = 0;
		for (const auto& [roomId, r] : rooms_)
			holders += r.items.count(itemId) ? 1 : 0;
		for (const auto& [id, p] : players_)
			holders += p.inventory.count(itemId) ? 1 : 0;

		bool offline_carrier = it.owner.kind == OwnerKind::CARRIER && !by_name_.count(it.owner.id);
		int expected = offline_carrier ? 0 : 1;
		if (holders != expected)
			bad.push_back("(c) item " + itemId + " held " + to_string(holders) + " times, owner " + owner_text(it.owner));
	}
	for (const auto& [id, p] : players_)
	{
		for (const auto& itemId : p.inventory)
		{
			auto iit = items_.find(itemId);
			if (iit == items_.end() || !(iit->second.owner == ItemOwner{ OwnerKind::CARRIER, p.username }))
				bad.push_back("(c) item " + itemId + " in " + p.username + "'s inventory");
		}
	}
	return bad;
}
