#pragma once
#include "Account.hpp"
#include <string>

using namespace std;

class Database;

class SqliteAccountService : public AccountService
{
public:
	explicit SqliteAccountService(Database& db);

	AccountResult signup(const string& username, const string& password) override;
	AccountResult login(const string& username, const string& password) override;

	static bool valid_name(const string& username);

private:
	Database& db_;
};
