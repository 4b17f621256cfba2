#include "BroadcastRouter.hpp"
#include "World.hpp"
#include "../common/common.hpp"
#include <exception>

using namespace std;

BroadcastRouter::BroadcastRouter(const World& world)
	: world_(world)
{
}

void BroadcastRouter::attach(SessionId id, shared_ptr<Outbox> out)
{
	lock_guard<mutex> lk(mu_);
	outboxes_[id] = move(out);
}

void BroadcastRouter::detach(SessionId id)
{
	lock_guard<mutex> lk(mu_);
	outboxes_.erase(id);
}

size_t BroadcastRouter::attached() const
{
	lock_guard<mutex> lk(mu_);
	return outboxes_.size();
}

vector<SessionId> BroadcastRouter::recipients(const Event& e) const
{
	vector<SessionId> ids;
	switch (e.scope)
	{
	case Scope::ROOM:
		ids = world_.sessions_in_room(e.roomId);
		break;
	case Scope::GLOBAL:
		ids = world_.online_sessions();
		break;
	case Scope::DIRECT:
		ids.push_back(e.target);
		break;
	}
	if (e.exclude)
		erase(ids, e.exclude);
	return ids;
}

void BroadcastRouter::publish(const Event& e)
{
	// membership is read from the world first; the two locks are never held together
	auto ids = recipients(e);

	vector<pair<SessionId, shared_ptr<Outbox>>> targets;
	{
		lock_guard<mutex> lk(mu_);
		for (auto id : ids)
		{
			auto it = outboxes_.find(id);
			if (it == outboxes_.end())
				continue;
			if (auto out = it->second.lock())
				targets.emplace_back(id, move(out));
			else
				outboxes_.erase(it);
		}
	}

	for (const auto& [id, out] : targets)
		deliver(id, out, e.text);
}

void BroadcastRouter::publish_all(const vector<Event>& events)
{
	for (const auto& e : events)
		publish(e);
}

void BroadcastRouter::deliver(SessionId id, const shared_ptr<Outbox>& out, const string& text)
{
	bool queued = false;
	try
	{
		queued = out->push_line(text);
	}
	catch (const exception& ex)
	{
		common::warn("ROUTER", "send to session " + to_string(id) + " failed: " + ex.what());
	}

	if (!queued)
	{
		common::warn("ROUTER", "session " + to_string(id) + " cannot take more output, closing");
		detach(id);
		out->close();
	}
}
