#pragma once
#include "Room.hpp"
#include <string>
#include <vector>

using namespace std;

enum class Scope
{
	ROOM, GLOBAL, DIRECT
};

// immutable once built; rendered text without the trailing newline
struct Event
{
	Scope scope = Scope::DIRECT;
	string roomId;          // ROOM
	SessionId target = 0;   // DIRECT
	SessionId exclude = 0;  // ROOM/GLOBAL: skip this session, 0 = nobody
	string text;

	static Event room(string roomId, string text, SessionId exclude = 0)
	{
		Event e;
		e.scope = Scope::ROOM;
		e.roomId = move(roomId);
		e.exclude = exclude;
		e.text = move(text);
		return e;
	}
	static Event global(string text)
	{
		Event e;
		e.scope = Scope::GLOBAL;
		e.text = move(text);
		return e;
	}
	static Event direct(SessionId target, string text)
	{
		Event e;
		e.scope = Scope::DIRECT;
		e.target = target;
		e.text = move(text);
		return e;
	}
};
