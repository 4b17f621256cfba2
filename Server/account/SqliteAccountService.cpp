#include "SqliteAccountService.hpp"
#include "Database.hpp"
#include "Password.hpp"
#include "../common/common.hpp"

using namespace std;

const char* describe(AccountError e)
{
	switch (e)
	{
	case AccountError::NONE: return "ok";
	case AccountError::USERNAME_TAKEN: return "Username already exists";
	case AccountError::BAD_CREDENTIALS: return "Invalid username or password";
	case AccountError::INVALID_NAME: return "Usernames are 3-20 letters, digits or underscores";
	case AccountError::INVALID_PASSWORD: return "Password cannot be empty";
	case AccountError::STORAGE: return "Account storage is unavailable, try again later";
	}
	return "unknown error";
}

SqliteAccountService::SqliteAccountService(Database& db)
	: db_(db)
{
}

bool SqliteAccountService::valid_name(const string& username)
{
	if (username.size() < 3 || username.size() > 20)
		return false;
	for (unsigned char c : username)
	{
		if (!(islower(c) || isdigit(c) || c == '_'))
			return false;
	}
	return true;
}

AccountResult SqliteAccountService::signup(const string& username, const string& password)
{
	AccountResult r;
	r.username = common::lower(common::trim(username));
	if (!valid_name(r.username))
	{
		r.error = AccountError::INVALID_NAME;
		return r;
	}
	if (password.empty())
	{
		r.error = AccountError::INVALID_PASSWORD;
		return r;
	}

	try
	{
		if (!db_.create_user(r.username, password::hash(password)))
		{
			r.error = AccountError::USERNAME_TAKEN;
			return r;
		}
	}
	catch (const runtime_error& ex)
	{
		common::warn("DB", "signup of " + r.username + " failed: " + ex.what());
		r.error = AccountError::STORAGE;
		return r;
	}

	r.roomId = db_.start_room();
	common::log("DB", "account created: " + r.username);
	return r;
}

AccountResult SqliteAccountService::login(const string& username, const string& password)
{
	AccountResult r;
	r.username = common::lower(common::trim(username));

	try
	{
		auto row = db_.find_user(r.username);
		if (!row || !password::verify(password, row->passwordHash))
		{
			r.error = AccountError::BAD_CREDENTIALS;
			return r;
		}
		db_.touch_login(r.username);
		r.roomId = row->currentRoom;
	}
	catch (const runtime_error& ex)
	{
		common::warn("DB", "login of " + r.username + " failed: " + ex.what());
		r.error = AccountError::STORAGE;
	}
	return r;
}
