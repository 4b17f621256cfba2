#pragma once
#include <string>
#include <vector>

using namespace std;

namespace password
{
	inline constexpr int SALT_BYTES = 32;
	inline constexpr int HASH_BYTES = 32;
	inline constexpr int ITERATIONS = 100000;

	// salt followed by PBKDF2-HMAC-SHA256 of the password
	vector<unsigned char> hash(const string& password);
	bool verify(const string& password, const vector<unsigned char>& stored);
}
