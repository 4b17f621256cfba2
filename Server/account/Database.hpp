#pragma once
#include "Account.hpp"
#include "../world/Room.hpp"
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

struct sqlite3;

class DatabaseError : public runtime_error
{
public:
	using runtime_error::runtime_error;
};

struct UserRow
{
	string username;
	vector<unsigned char> passwordHash;
	string currentRoom;
};

// The built-in San Antonio world written into empty tables on first open.
WorldData seed_world();

class Database : public LocationStore
{
public:
	explicit Database(const string& path, const string& startRoom = "alamo_plaza");
	~Database() override;

	Database(const Database&) = delete;
	Database& operator=(const Database&) = delete;

	WorldData load_world();

	bool create_user(const string& username, const vector<unsigned char>& passwordHash);
	optional<UserRow> find_user(const string& username);
	void touch_login(const string& username);
	optional<string> last_location(const string& username);

	void persist_location(const string& username, const string& roomId) override;
	void persist_items(const vector<ItemPlacement>& placements) override;

	const string& start_room() const { return start_room_; }

private:
	void exec(const char* sql);
	void create_schema();
	void seed_if_empty();
	void write_world(const WorldData& w);

private:
	sqlite3* db_ = nullptr;
	mutex mu_;
	string start_room_;
};
