#include "../common/common.hpp"
#include "../common/config.hpp"
#include "../common/net.hpp"
#include "../account/Database.hpp"
#include "../account/SqliteAccountService.hpp"
#include "World.hpp"
#include "Dispatcher.hpp"
#include "BroadcastRouter.hpp"
#include "TickScheduler.hpp"
#include "TcpAcceptor.hpp"
#include "Session.hpp"
#include <asio.hpp>
#include <csignal>
#include <memory>
#include <string>

using namespace std;

namespace
{
	// Writes every online player's room and every item's owner.
	void save_all(World& world, Database& db)
	{
		size_t saved = 0;
		for (const auto& [username, roomId] : world.player_locations())
		{
			try
			{
				db.persist_location(username, roomId);
				saved++;
			}
			catch (const runtime_error& ex)
			{
				common::warn("DB", "could not save " + username + ": " + ex.what());
			}
		}
		try
		{
			db.persist_items(world.item_placements());
		}
		catch (const runtime_error& ex)
		{
			common::warn("DB", string("could not save items: ") + ex.what());
		}
		common::log("DB", "saved " + to_string(saved) + " player location(s)");
	}
}

int main(int argc, char* argv[])
{
	common::Config cfg = common::parse_config(argc, argv);

	unique_ptr<Database> db;
	unique_ptr<World> world;
	try
	{
		db = make_unique<Database>(cfg.db_path, cfg.start_room);
		world = make_unique<World>(db->load_world(), cfg.start_room);
	}
	catch (const runtime_error& ex)
	{
		common::warn("SERVER", string("cannot load world: ") + ex.what());
		return 1;
	}
	common::log("WORLD", "loaded from " + cfg.db_path);

	asio::io_context io;
	Dispatcher dispatcher(*world);
	BroadcastRouter router(*world);
	SqliteAccountService accounts(*db);
	Services svc{ *world, dispatcher, router, accounts, *db };

	unique_ptr<TcpAcceptor> acceptor;
	try
	{
		acceptor = make_unique<TcpAcceptor>(io, cfg.port, svc, cfg.outq_limit);
	}
	catch (const system_error& ex)
	{
		common::warn("SERVER", "cannot listen on port " + to_string(cfg.port) + ": " + ex.what());
		return 1;
	}

	TickScheduler ticker(io, *world, router, cfg.tick_ms, cfg.wander_percent);
	ticker.start();

	common::log("SERVER", "connect with: telnet localhost " + to_string(cfg.port));
	common::log("SERVER", "         or: nc localhost " + to_string(cfg.port));
	for (const auto& addr : net::local_addresses(io))
		common::log("SERVER", "network: telnet " + addr + " " + to_string(cfg.port));

	asio::signal_set signals(io, SIGINT, SIGTERM);
	signals.async_wait([&](error_code ec, int sig)
		{
			if (ec)
				return;
			common::log("SERVER", "signal " + to_string(sig) + ", shutting down");
			acceptor->stop();
			ticker.stop();
			save_all(*world, *db);
			io.stop();
		});

	common::log("SERVER", "running on " + to_string(cfg.threads) + " thread(s)");
	net::run_io_threads(io, cfg.threads);
	common::log("SERVER", "stopped");
	return 0;
}
