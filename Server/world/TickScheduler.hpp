#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>

using namespace std;

class World;
class BroadcastRouter;

// Wanders NPCs on a fixed interval. One timer, one strand: a tick never
// overlaps the next one.
class TickScheduler
{
public:
	using Executor = asio::io_context::executor_type;

	TickScheduler(asio::io_context& io, World& world, BroadcastRouter& router,
		int tick_ms, int wander_percent, uint32_t seed = random_device{}());

	void start();
	void stop();
	size_t run_once();

	uint64_t ticks() const { return ticks_.load(); }

private:
	void schedule_tick();

private:
	World& world_;
	BroadcastRouter& router_;
	asio::strand<Executor> strand_;
	asio::steady_timer tick_;
	int tick_ms_;
	int wander_percent_;
	mt19937 rng_;
	atomic<uint64_t> ticks_{ 0 };
	bool stopped_ = false;
};
