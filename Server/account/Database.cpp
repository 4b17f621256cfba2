#include "Database.hpp"
#include "../common/common.hpp"
#include <sqlite3.h>
#include <map>

using namespace std;

namespace
{
	class Statement
	{
	public:
		Statement(sqlite3* db, const char* sql)
			: db_(db)
		{
			if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
				throw DatabaseError(string("prepare failed: ") + sqlite3_errmsg(db) + " in: " + sql);
		}
		~Statement() { sqlite3_finalize(stmt_); }

		Statement(const Statement&) = delete;
		Statement& operator=(const Statement&) = delete;

		Statement& bind(int i, const string& v)
		{
			check(sqlite3_bind_text(stmt_, i, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
			return *this;
		}
		Statement& bind(int i, int v)
		{
			check(sqlite3_bind_int(stmt_, i, v));
			return *this;
		}
		Statement& bind(int i, const vector<unsigned char>& v)
		{
			check(sqlite3_bind_blob(stmt_, i, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
			return *this;
		}

		// true while rows remain
		bool step()
		{
			int rc = sqlite3_step(stmt_);
			if (rc == SQLITE_ROW)
				return true;
			if (rc == SQLITE_DONE)
				return false;
			throw DatabaseError(string("step failed: ") + sqlite3_errmsg(db_));
		}

		string text(int col)
		{
			auto p = sqlite3_column_text(stmt_, col);
			return p ? string(reinterpret_cast<const char*>(p), sqlite3_column_bytes(stmt_, col)) : "";
		}
		vector<unsigned char> blob(int col)
		{
			auto p = static_cast<const unsigned char*>(sqlite3_column_blob(stmt_, col));
			int n = sqlite3_column_bytes(stmt_, col);
			return p ? vector<unsigned char>(p, p + n) : vector<unsigned char>{};
		}

	private:
		void check(int rc)
		{
			if (rc != SQLITE_OK)
				throw DatabaseError(string("bind failed: ") + sqlite3_errmsg(db_));
		}

		sqlite3* db_;
		sqlite3_stmt* stmt_ = nullptr;
	};

	const char* kSchema = R"(
		CREATE TABLE IF NOT EXISTS users (
			username TEXT PRIMARY KEY,
			password_hash BLOB NOT NULL,
			current_room TEXT NOT NULL,
			created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
			last_login TIMESTAMP
		);
		CREATE TABLE IF NOT EXISTS rooms (
			id TEXT PRIMARY KEY,
			name TEXT NOT NULL,
			description TEXT NOT NULL,
			ord INTEGER NOT NULL
		);
		CREATE TABLE IF NOT EXISTS room_exits (
			room_id TEXT NOT NULL,
			direction TEXT NOT NULL,
			target TEXT NOT NULL,
			ord INTEGER NOT NULL,
			PRIMARY KEY (room_id, direction)
		);
		CREATE TABLE IF NOT EXISTS npcs (
			id TEXT PRIMARY KEY,
			name TEXT NOT NULL,
			description TEXT NOT NULL,
			room_id TEXT NOT NULL
		);
		CREATE TABLE IF NOT EXISTS npc_responses (
			npc_id TEXT NOT NULL,
			keyword TEXT NOT NULL,
			response TEXT NOT NULL,
			PRIMARY KEY (npc_id, keyword)
		);
		CREATE TABLE IF NOT EXISTS npc_wander (
			npc_id TEXT NOT NULL,
			room_id TEXT NOT NULL,
			PRIMARY KEY (npc_id, room_id)
		);
		CREATE TABLE IF NOT EXISTS items (
			id TEXT PRIMARY KEY,
			name TEXT NOT NULL,
			description TEXT NOT NULL,
			location_type TEXT NOT NULL,
			location_id TEXT NOT NULL
		);
	)";
}

Database::Database(const string& path, const string& startRoom)
	: start_room_(startRoom)
{
	int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
	if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK)
	{
		string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
		sqlite3_close(db_);
		db_ = nullptr;
		throw DatabaseError("cannot open " + path + ": " + err);
	}

	lock_guard<mutex> lk(mu_);
	create_schema();
	seed_if_empty();
	common::log("DB", "database ready: " + path);
}

Database::~Database()
{
	sqlite3_close(db_);
}

void Database::exec(const char* sql)
{
	char* err = nullptr;
	if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK)
	{
		string msg = err ? err : "unknown error";
		sqlite3_free(err);
		throw DatabaseError("exec failed: " + msg);
	}
}

void Database::create_schema()
{
	exec(kSchema);
}

void Database::seed_if_empty()
{
	Statement count(db_, "SELECT COUNT(*) FROM rooms");
	count.step();
	if (count.text(0) != "0")
		return;

	write_world(seed_world());
	common::log("DB", "initial world created");
}

void Database::write_world(const WorldData& w)
{
	exec("BEGIN");
	try
	{
		int ord = 0;
		for (const auto& r : w.rooms)
		{
			Statement(db_, "INSERT INTO rooms (id, name, description, ord) VALUES (?, ?, ?, ?)")
				.bind(1, r.roomId).bind(2, r.name).bind(3, r.description).bind(4, ord++).step();

			int e = 0;
			for (const auto& [dir, target] : r.exits)
			{
				Statement(db_, "INSERT INTO room_exits (room_id, direction, target, ord) VALUES (?, ?, ?, ?)")
					.bind(1, r.roomId).bind(2, dir).bind(3, target).bind(4, e++).step();
			}
		}
		for (const auto& n : w.npcs)
		{
			Statement(db_, "INSERT INTO npcs (id, name, description, room_id) VALUES (?, ?, ?, ?)")
				.bind(1, n.npcId).bind(2, n.name).bind(3, n.description).bind(4, n.roomId).step();
			for (const auto& [kw, line] : n.responses)
			{
				Statement(db_, "INSERT INTO npc_responses (npc_id, keyword, response) VALUES (?, ?, ?)")
					.bind(1, n.npcId).bind(2, kw).bind(3, line).step();
			}
			for (const auto& roomId : n.wander)
			{
				Statement(db_, "INSERT INTO npc_wander (npc_id, room_id) VALUES (?, ?)")
					.bind(1, n.npcId).bind(2, roomId).step();
			}
		}
		for (const auto& it : w.items)
		{
			Statement(db_, "INSERT INTO items (id, name, description, location_type, location_id) VALUES (?, ?, ?, ?, ?)")
				.bind(1, it.itemId).bind(2, it.name).bind(3, it.description)
				.bind(4, string(it.owner.kind == OwnerKind::ROOM ? "room" : "player")).bind(5, it.owner.id).step();
		}
		exec("COMMIT");
	}
	catch (const DatabaseError&)
	{
		exec("ROLLBACK");
		throw;
	}
}

WorldData Database::load_world()
{
	lock_guard<mutex> lk(mu_);
	WorldData w;
	map<string, size_t> room_index;

	Statement rooms(db_, "SELECT id, name, description FROM rooms ORDER BY ord");
	while (rooms.step())
	{
		Room r;
		r.roomId = rooms.text(0);
		r.name = rooms.text(1);
		r.description = rooms.text(2);
		room_index[r.roomId] = w.rooms.size();
		w.rooms.push_back(move(r));
	}

	Statement exits(db_, "SELECT room_id, direction, target FROM room_exits ORDER BY room_id, ord");
	while (exits.step())
	{
		auto it = room_index.find(exits.text(0));
		if (it == room_index.end())
			throw DatabaseError("exit from unknown room " + exits.text(0));
		w.rooms[it->second].exits.emplace_back(exits.text(1), exits.text(2));
	}

	map<string, size_t> npc_index;
	Statement npcs(db_, "SELECT id, name, description, room_id FROM npcs ORDER BY id");
	while (npcs.step())
	{
		Npc n;
		n.npcId = npcs.text(0);
		n.name = npcs.text(1);
		n.description = npcs.text(2);
		n.roomId = npcs.text(3);
		npc_index[n.npcId] = w.npcs.size();
		w.npcs.push_back(move(n));
	}

	Statement responses(db_, "SELECT npc_id, keyword, response FROM npc_responses");
	while (responses.step())
	{
		auto it = npc_index.find(responses.text(0));
		if (it != npc_index.end())
			w.npcs[it->second].responses[common::lower(responses.text(1))] = responses.text(2);
	}

	Statement wander(db_, "SELECT npc_id, room_id FROM npc_wander ORDER BY npc_id, room_id");
	while (wander.step())
	{
		auto it = npc_index.find(wander.text(0));
		if (it != npc_index.end())
			w.npcs[it->second].wander.push_back(wander.text(1));
	}

	Statement items(db_, "SELECT id, name, description, location_type, location_id FROM items ORDER BY id");
	while (items.step())
	{
		Item it;
		it.itemId = items.text(0);
		it.name = items.text(1);
		it.description = items.text(2);
		it.owner.kind = items.text(3) == "player" ? OwnerKind::CARRIER : OwnerKind::ROOM;
		it.owner.id = items.text(4);
		w.items.push_back(move(it));
	}
	return w;
}

bool Database::create_user(const string& username, const vector<unsigned char>& passwordHash)
{
	lock_guard<mutex> lk(mu_);
	Statement exists(db_, "SELECT 1 FROM users WHERE username = ?");
	if (exists.bind(1, username).step())
		return false;

	Statement ins(db_, "INSERT INTO users (username, password_hash, current_room) VALUES (?, ?, ?)");
	ins.bind(1, username).bind(2, passwordHash).bind(3, start_room_).step();
	return true;
}

optional<UserRow> Database::find_user(const string& username)
{
	lock_guard<mutex> lk(mu_);
	Statement q(db_, "SELECT username, password_hash, current_room FROM users WHERE username = ?");
	if (!q.bind(1, username).step())
		return nullopt;

	UserRow row;
	row.username = q.text(0);
	row.passwordHash = q.blob(1);
	row.currentRoom = q.text(2);
	return row;
}

void Database::touch_login(const string& username)
{
	lock_guard<mutex> lk(mu_);
	Statement(db_, "UPDATE users SET last_login = CURRENT_TIMESTAMP WHERE username = ?").bind(1, username).step();
}

optional<string> Database::last_location(const string& username)
{
	lock_guard<mutex> lk(mu_);
	Statement q(db_, "SELECT current_room FROM users WHERE username = ?");
	if (!q.bind(1, username).step())
		return nullopt;
	return q.text(0);
}

void Database::persist_location(const string& username, const string& roomId)
{
	lock_guard<mutex> lk(mu_);
	Statement(db_, "UPDATE users SET current_room = ? WHERE username = ?").bind(1, roomId).bind(2, username).step();
	if (sqlite3_changes(db_) == 0)
		common::warn("DB", "no account row for " + username + ", location not saved");
}

void Database::persist_items(const vector<ItemPlacement>& placements)
{
	lock_guard<mutex> lk(mu_);
	exec("BEGIN");
	try
	{
		for (const auto& p : placements)
		{
			Statement(db_, "UPDATE items SET location_type = ?, location_id = ? WHERE id = ?")
				.bind(1, string(p.owner.kind == OwnerKind::ROOM ? "room" : "player"))
				.bind(2, p.owner.id).bind(3, p.itemId).step();
		}
		exec("COMMIT");
	}
	catch (const DatabaseError&)
	{
		exec("ROLLBACK");
		throw;
	}
}
