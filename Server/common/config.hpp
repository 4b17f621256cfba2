#pragma once
#include "common.hpp"
#include "net.hpp"
#include <algorithm>
#include <string>
#include <thread>

using namespace std;

namespace common
{
	struct Config
	{
		unsigned short port = 2323;
		int threads = 1;
		int tick_ms = 10000;
		int wander_percent = 35;
		size_t outq_limit = 256;
		string db_path = "samud.db";
		string start_room = "alamo_plaza";
	};

	// samud [port] [port=N] [threads=N] [tick_ms=N] [wander=N] [outq=N] [db=PATH] [start=ROOM]
	inline Config parse_config(int argc, char* argv[])
	{
		Config c;
		c.threads = static_cast<int>(max(1u, thread::hardware_concurrency()));

		string joined;
		for (int i = 1; i < argc; i++)
		{
			string arg = argv[i];
			if (arg.find('=') == string::npos)
			{
				int p = to_int(arg.c_str(), -1);
				if (p > 0 && p < 65536)
					c.port = static_cast<unsigned short>(p);
				continue;
			}
			joined += arg + " ";
		}

		auto kv = net::kvparse(joined);
		auto num = [&](const char* key, int d, int lo, int hi)
		{
			auto it = kv.find(key);
			if (it == kv.end())
				return d;
			int v = to_int(it->second.c_str(), d);
			return (v < lo || v > hi) ? d : v;
		};

		c.port = static_cast<unsigned short>(num("port", c.port, 1, 65535));
		c.threads = num("threads", c.threads, 1, 256);
		c.tick_ms = num("tick_ms", c.tick_ms, 10, 3600000);
		c.wander_percent = num("wander", c.wander_percent, 0, 100);
		c.outq_limit = static_cast<size_t>(num("outq", static_cast<int>(c.outq_limit), 1, 1 << 20));
		if (kv.count("db") && !kv["db"].empty())
			c.db_path = kv["db"];
		if (kv.count("start") && !kv["start"].empty())
			c.start_room = kv["start"];
		return c;
	}
}
