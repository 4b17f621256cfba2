#pragma once
#include "account/Database.hpp"
#include "account/Account.hpp"
#include "world/BroadcastRouter.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using namespace std;

// Collects everything routed to one session.
class RecordingOutbox : public Outbox
{
public:
	explicit RecordingOutbox(size_t limit = 1000) : limit_(limit) {}

	bool push_line(string line) override
	{
		lock_guard<mutex> lk(mu_);
		if (closed_ || lines_.size() >= limit_)
			return false;
		lines_.push_back(move(line));
		return true;
	}
	void close() override
	{
		lock_guard<mutex> lk(mu_);
		closed_ = true;
	}

	vector<string> lines() const
	{
		lock_guard<mutex> lk(mu_);
		return lines_;
	}
	bool saw(const string& needle) const
	{
		lock_guard<mutex> lk(mu_);
		return any_of(lines_.begin(), lines_.end(), [&](const string& l) { return l.find(needle) != string::npos; });
	}
	bool closed() const
	{
		lock_guard<mutex> lk(mu_);
		return closed_;
	}
	void clear()
	{
		lock_guard<mutex> lk(mu_);
		lines_.clear();
	}

private:
	mutable mutex mu_;
	vector<string> lines_;
	size_t limit_;
	bool closed_ = false;
};

inline Room test_room(string id, string name, vector<pair<string, string>> exits)
{
	Room r;
	r.roomId = move(id);
	r.name = move(name);
	r.description = "A test room.";
	r.exits = move(exits);
	return r;
}

inline Item test_item(string id, string name, string roomId)
{
	return { move(id), move(name), "Something small.", { OwnerKind::ROOM, move(roomId) } };
}

// In-memory accounts: passwords by name, saved rooms by name.
class FakeAccounts : public AccountService
{
public:
	AccountResult signup(const string& username, const string& password) override
	{
		lock_guard<mutex> lk(mu_);
		AccountResult r;
		r.username = username;
		if (passwords.count(username))
			r.error = AccountError::USERNAME_TAKEN;
		else
		{
			passwords[username] = password;
			r.roomId = "alamo_plaza";
		}
		return r;
	}
	AccountResult login(const string& username, const string& password) override
	{
		lock_guard<mutex> lk(mu_);
		AccountResult r;
		r.username = username;
		auto it = passwords.find(username);
		if (it == passwords.end() || it->second != password)
			r.error = AccountError::BAD_CREDENTIALS;
		else
			r.roomId = rooms.count(username) ? rooms[username] : "alamo_plaza";
		return r;
	}

	map<string, string> passwords;
	map<string, string> rooms;

private:
	mutex mu_;
};

// Records what a session saves. location() may be read while io threads write.
class FakeStore : public LocationStore
{
public:
	void persist_location(const string& username, const string& roomId) override
	{
		lock_guard<mutex> lk(mu_);
		locations[username] = roomId;
	}
	void persist_items(const vector<ItemPlacement>& placements) override
	{
		lock_guard<mutex> lk(mu_);
		for (const auto& p : placements)
			items[p.itemId] = p.owner;
	}

	string location(const string& username) const
	{
		lock_guard<mutex> lk(mu_);
		auto it = locations.find(username);
		return it == locations.end() ? "" : it->second;
	}

	map<string, string> locations;
	map<string, ItemOwner> items;

private:
	mutable mutex mu_;
};
