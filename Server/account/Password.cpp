#include "Password.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

using namespace std;

namespace
{
	vector<unsigned char> derive(const string& pw, const unsigned char* salt)
	{
		vector<unsigned char> out(password::HASH_BYTES);
		if (PKCS5_PBKDF2_HMAC(pw.data(), static_cast<int>(pw.size()), salt, password::SALT_BYTES,
			password::ITERATIONS, EVP_sha256(), password::HASH_BYTES, out.data()) != 1)
			throw runtime_error("PBKDF2 failed");
		return out;
	}
}

vector<unsigned char> password::hash(const string& pw)
{
	vector<unsigned char> stored(SALT_BYTES);
	if (RAND_bytes(stored.data(), SALT_BYTES) != 1)
		throw runtime_error("no randomness for salt");

	auto h = derive(pw, stored.data());
	stored.insert(stored.end(), h.begin(), h.end());
	return stored;
}

bool password::verify(const string& pw, const vector<unsigned char>& stored)
{
	if (stored.size() != SALT_BYTES + HASH_BYTES)
		return false;
	auto h = derive(pw, stored.data());
	return CRYPTO_memcmp(h.data(), stored.data() + SALT_BYTES, HASH_BYTES) == 0;
}
