#pragma once
#include "../world/Room.hpp"
#include <string>
#include <vector>

using namespace std;

enum class AccountError
{
	NONE, USERNAME_TAKEN, BAD_CREDENTIALS, INVALID_NAME, INVALID_PASSWORD, STORAGE
};

const char* describe(AccountError e);

struct AccountResult
{
	AccountError error = AccountError::NONE;
	string username;
	string roomId; // last saved room, or the start room for a new account

	bool ok() const { return error == AccountError::NONE; }
};

class AccountService
{
public:
	virtual ~AccountService() = default;
	virtual AccountResult signup(const string& username, const string& password) = 0;
	virtual AccountResult login(const string& username, const string& password) = 0;
};

class LocationStore
{
public:
	virtual ~LocationStore() = default;
	virtual void persist_location(const string& username, const string& roomId) = 0;
	virtual void persist_items(const vector<ItemPlacement>& placements) = 0;
};
