#pragma once
#include "Event.hpp"
#include "World.hpp"
#include <string>
#include <vector>

using namespace std;

enum class Verb
{
	LOOK, MOVE, WHERE, SAY, SHOUT, EMOTE, WHISPER, GET, DROP, INVENTORY, TALK, WHO, HELP, QUIT, LOGIN, SIGNUP, UNKNOWN
};

struct Reply
{
	vector<string> lines;  // straight back to the issuing session
	vector<Event> events;  // for the router, in causal order
	bool quit = false;
};

class Dispatcher
{
public:
	explicit Dispatcher(World& world);

	Reply dispatch(SessionId session, bool authenticated, const string& rawLine) const;

	static Verb parse_verb(const string& verb);
	static bool needs_login(Verb v);
	static string render_room(const RoomView& v);
	static string help_text();

private:
	Reply run(SessionId s, Verb verb, const string& word, const string& rest) const;

	Reply look(SessionId s) const;
	Reply go(SessionId s, const string& direction) const;
	Reply where(SessionId s) const;
	Reply say(SessionId s, const string& text) const;
	Reply shout(SessionId s, const string& text) const;
	Reply emote(SessionId s, const string& text) const;
	Reply whisper(SessionId s, const string& rest) const;
	Reply get(SessionId s, const string& fragment) const;
	Reply drop(SessionId s, const string& fragment) const;
	Reply inventory(SessionId s) const;
	Reply talk(SessionId s, const string& rest) const;
	Reply who() const;

	static Reply text(string line);
	static Reply refused(WorldError e);

private:
	World& world_;
};
