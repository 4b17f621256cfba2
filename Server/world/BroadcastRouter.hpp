#pragma once
#include "Event.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

class World;

// Outbound side of one connection. push_line must not block; it returns false
// when the line cannot be queued (queue full, connection gone).
class Outbox
{
public:
	virtual ~Outbox() = default;
	virtual bool push_line(string line) = 0;
	virtual void close() = 0;
};

class BroadcastRouter
{
public:
	explicit BroadcastRouter(const World& world);

	void attach(SessionId id, shared_ptr<Outbox> out);
	void detach(SessionId id);

	void publish(const Event& e);
	void publish_all(const vector<Event>& events);

	size_t attached() const;

private:
	vector<SessionId> recipients(const Event& e) const;
	void deliver(SessionId id, const shared_ptr<Outbox>& out, const string& text);

private:
	const World& world_;
	mutable mutex mu_;
	unordered_map<SessionId, weak_ptr<Outbox>> outboxes_; // sessionId, connection
};
