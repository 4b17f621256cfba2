#pragma once
#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif
#include <asio.hpp>
#include <algorithm>
#include <thread>
#include <string>
#include <unordered_map>
#include <sstream>
#include <vector>

using namespace std;

namespace net
{

	inline void run_io_threads(asio::io_context& io, int n)
	{
		vector<thread> ths;
		ths.reserve(n);
		for (int i = 0; i < n; i++)
		{
			ths.emplace_back([&] { io.run(); });
		}
		for (auto& t : ths)
			t.join();
	}

	inline unordered_map<string, string> kvparse(const string& s)
	{
		unordered_map<string, string> m;
		istringstream is(s);
		string tok;
		while (is >> tok)
		{
			auto p = tok.find('=');
			if (p != string::npos)
			{
				m.emplace(tok.substr(0, p), tok.substr(p + 1));
			}
		}
		return m;
	}

	// "verb rest of line" -> {verb, rest}; rest keeps its inner spacing
	inline pair<string, string> split_verb(const string& line)
	{
		auto b = line.find_first_not_of(" \t");
		if (b == string::npos)
			return {};
		auto e = line.find_first_of(" \t", b);
		if (e == string::npos)
			return { line.substr(b), "" };

		string rest = line.substr(e);
		auto rb = rest.find_first_not_of(" \t");
		auto re = rest.find_last_not_of(" \t\r");
		if (rb == string::npos)
			rest.clear();
		else
			rest = rest.substr(rb, re - rb + 1);
		return { line.substr(b, e - b), move(rest) };
	}

	inline vector<string> local_addresses(asio::io_context& io)
	{
		vector<string> out;
		asio::error_code ec;
		string host = asio::ip::host_name(ec);
		if (ec)
			return out;
		asio::ip::tcp::resolver resolver(io);
		auto results = resolver.resolve(host, "", ec);
		if (ec)
			return out;
		for (const auto& entry : results)
		{
			auto addr = entry.endpoint().address();
			if (addr.is_v4() && !addr.is_loopback())
			{
				string s = addr.to_string();
				if (find(out.begin(), out.end(), s) == out.end())
					out.push_back(s);
			}
		}
		return out;
	}

}
