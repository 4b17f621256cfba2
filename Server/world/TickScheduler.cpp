#include "TickScheduler.hpp"
#include "World.hpp"
#include "BroadcastRouter.hpp"
#include "../common/common.hpp"
#include <exception>

using namespace std;

TickScheduler::TickScheduler(asio::io_context& io, World& world, BroadcastRouter& router,
	int tick_ms, int wander_percent, uint32_t seed)
	: world_(world)
	, router_(router)
	, strand_(io.get_executor())
	, tick_(io)
	, tick_ms_(tick_ms)
	, wander_percent_(wander_percent)
	, rng_(seed)
{
}

void TickScheduler::start()
{
	asio::post(strand_, [this]
		{
			stopped_ = false;
			common::log("TICK", "npc tick every " + to_string(tick_ms_) + "ms, wander " + to_string(wander_percent_) + "%");
			schedule_tick();
		});
}

void TickScheduler::stop()
{
	asio::post(strand_, [this]
		{
			stopped_ = true;
			tick_.cancel();
		});
}

void TickScheduler::schedule_tick()
{
	tick_.expires_after(chrono::milliseconds(tick_ms_));
	tick_.async_wait(asio::bind_executor(strand_, [this](error_code ec)
		{
			if (ec || stopped_)
				return;
			run_once();
			schedule_tick();
		}
	)
	);
}

// Runs one tick on the calling thread and returns how many events it published.
size_t TickScheduler::run_once()
{
	ticks_++;
	vector<Event> events;
	try
	{
		events = world_.tick_advance_npcs(rng_, wander_percent_);
	}
	catch (const exception& ex)
	{
		common::warn("TICK", string("tick ") + to_string(ticks_.load()) + " abandoned: " + ex.what());
		return 0;
	}

	for (size_t i = 0; i + 1 < events.size(); i += 2)
		common::log("TICK", events[i].text);
	router_.publish_all(events);
	return events.size();
}
