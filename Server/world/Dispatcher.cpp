#include "Dispatcher.hpp"
#include "../common/common.hpp"
#include "../common/net.hpp"
#include <unordered_map>

using namespace std;

namespace
{
	const char* kLoginFirst = "You must log in first. Type 'login' to sign in or 'signup' to create an account.";

	const unordered_map<string, Verb>& verb_table()
	{
		static const unordered_map<string, Verb> table =
		{
			{ "look", Verb::LOOK }, { "l", Verb::LOOK },
			{ "n", Verb::MOVE }, { "north", Verb::MOVE },
			{ "s", Verb::MOVE }, { "south", Verb::MOVE },
			{ "e", Verb::MOVE }, { "east", Verb::MOVE },
			{ "w", Verb::MOVE }, { "west", Verb::MOVE },
			{ "go", Verb::MOVE }, { "move", Verb::MOVE },
			{ "where", Verb::WHERE },
			{ "say", Verb::SAY },
			{ "shout", Verb::SHOUT },
			{ "emote", Verb::EMOTE },
			{ "whisper", Verb::WHISPER },
			{ "get", Verb::GET }, { "take", Verb::GET },
			{ "drop", Verb::DROP },
			{ "inventory", Verb::INVENTORY }, { "inv", Verb::INVENTORY }, { "i", Verb::INVENTORY },
			{ "talk", Verb::TALK },
			{ "who", Verb::WHO },
			{ "help", Verb::HELP },
			{ "quit", Verb::QUIT },
			{ "login", Verb::LOGIN },
			{ "signup", Verb::SIGNUP },
		};
		return table;
	}
}

Dispatcher::Dispatcher(World& world)
	: world_(world)
{
}

Verb Dispatcher::parse_verb(const string& verb)
{
	auto it = verb_table().find(common::lower(verb));
	return it == verb_table().end() ? Verb::UNKNOWN : it->second;
}

bool Dispatcher::needs_login(Verb v)
{
	return v != Verb::HELP && v != Verb::QUIT && v != Verb::LOGIN && v != Verb::SIGNUP && v != Verb::UNKNOWN;
}

Reply Dispatcher::text(string line)
{
	Reply r;
	r.lines.push_back(move(line));
	return r;
}

Reply Dispatcher::refused(WorldError e)
{
	switch (e)
	{
	case WorldError::NOT_AUTHENTICATED:
		return text(kLoginFirst);
	default:
		return text(string("That didn't work (") + error_name(e) + ").");
	}
}

Reply Dispatcher::dispatch(SessionId session, bool authenticated, const string& rawLine) const
{
	auto [word, rest] = net::split_verb(rawLine);
	if (word.empty())
		return {};

	Verb verb = parse_verb(word);
	if (verb == Verb::UNKNOWN)
		return text("Unknown command: " + common::trim(rawLine) + "\nType 'help' for available commands");
	if (!authenticated && needs_login(verb))
		return text(kLoginFirst);

	try
	{
		return run(session, verb, common::lower(word), rest);
	}
	catch (const InvariantViolation& ex)
	{
		common::warn("WORLD", "invariant violation on '" + word + "' from session " + to_string(session) + ": " + ex.what());
		return text("Something went wrong; nothing was changed.");
	}
}

Reply Dispatcher::run(SessionId s, Verb verb, const string& word, const string& rest) const
{
	switch (verb)
	{
	case Verb::LOOK:
		return look(s);
	case Verb::MOVE:
		if (word == "go" || word == "move")
		{
			if (rest.empty())
				return text("Usage: " + word + " <direction>");
			return go(s, rest);
		}
		return go(s, word);
	case Verb::WHERE:
		return where(s);
	case Verb::SAY:
		return rest.empty() ? text("Usage: say <message>") : say(s, rest);
	case Verb::SHOUT:
		return rest.empty() ? text("Usage: shout <message>") : shout(s, rest);
	case Verb::EMOTE:
		return rest.empty() ? text("Usage: emote <action>") : emote(s, rest);
	case Verb::WHISPER:
		return whisper(s, rest);
	case Verb::GET:
		return rest.empty() ? text("Usage: get <item>") : get(s, rest);
	case Verb::DROP:
		return rest.empty() ? text("Usage: drop <item>") : drop(s, rest);
	case Verb::INVENTORY:
		return inventory(s);
	case Verb::TALK:
		return rest.empty() ? text("Usage: talk <npc_name> [keyword]") : talk(s, rest);
	case Verb::WHO:
		return who();
	case Verb::HELP:
		return text(help_text());
	case Verb::QUIT:
	{
		Reply r = text("Goodbye! Your progress has been saved.");
		r.quit = true;
		return r;
	}
	case Verb::LOGIN:
	case Verb::SIGNUP:
		return text("You are already logged in.");
	case Verb::UNKNOWN:
		break;
	}
	return text("Type 'help' for available commands");
}

string Dispatcher::render_room(const RoomView& v)
{
	string msg = v.name + "\n" + v.description + "\n";
	msg += v.exits.empty() ? "No obvious exits\n" : "Exits: " + common::join(v.exits, ", ") + "\n";
	msg += "Players here: " + (v.others.empty() ? string("none") : common::join(v.others, ", ")) + "\n";

	if (v.npcs.empty())
	{
		msg += "NPCs here: none\n";
	}
	else
	{
		msg += "NPCs here:\n";
		for (const auto& n : v.npcs)
			msg += "  " + n.name + " - " + n.description + "\n";
	}

	if (v.items.empty())
	{
		msg += "Items here: none";
	}
	else
	{
		msg += "Items here:";
		for (const auto& it : v.items)
			msg += "\n  " + it.name + " - " + it.description;
	}
	return msg;
}

string Dispatcher::help_text()
{
	return
		"=== SAN ANTONIO MUD COMMANDS ===\n"
		"\n"
		"EXPLORING:\n"
		"  look - Show room description, exits, people, and items\n"
		"  go <direction> - Move to another room\n"
		"  n/s/e/w - Quick movement (north/south/east/west)\n"
		"  where - Show your current location\n"
		"\n"
		"ITEMS:\n"
		"  get <item> - Pick up an item from the room\n"
		"  drop <item> - Drop an item from your inventory\n"
		"  inventory (inv/i) - Show what you're carrying\n"
		"\n"
		"NPCs:\n"
		"  talk <npc> [keyword] - Talk to NPCs (try: history, food, music)\n"
		"\n"
		"COMMUNICATION:\n"
		"  say <message> - Talk to people in the same room\n"
		"  shout <message> - Send message to all players\n"
		"  emote <action> - Act something out for the room\n"
		"  whisper <player> <message> - Private message to one player\n"
		"  who - Show online players\n"
		"\n"
		"SYSTEM:\n"
		"  help - Show this help\n"
		"  quit - Exit the MUD\n"
		"\n"
		"TIP: Most commands work with partial names!\n"
		"    Example: 'get pick' instead of 'get a tortoiseshell guitar pick'\n"
		"===============================";
}

Reply Dispatcher::look(SessionId s) const
{
	auto r = world_.look_at(s);
	if (!r.ok())
		return refused(r.error);
	return text(render_room(r.value));
}

Reply Dispatcher::go(SessionId s, const string& direction) const
{
	auto r = world_.move(s, direction);
	if (r.error == WorldError::NO_SUCH_EXIT)
	{
		string msg = "You can't go " + World::normalize_direction(direction) + " from here.";
		if (!r.candidates.empty())
			msg += "\nAvailable exits: " + common::join(r.candidates, ", ");
		return text(msg);
	}
	if (!r.ok())
		return refused(r.error);

	string name = world_.username_of(s);
	Reply out = text("You head " + r.value.direction + ".\n\n" + render_room(r.value.view));
	out.events.push_back(Event::room(r.value.fromRoom, name + " leaves " + r.value.direction + ".", s));
	out.events.push_back(Event::room(r.value.toRoom, name + " arrives.", s));
	return out;
}

Reply Dispatcher::where(SessionId s) const
{
	auto r = world_.where(s);
	if (!r.ok())
		return refused(r.error);
	return text("You are at " + r.value);
}

Reply Dispatcher::say(SessionId s, const string& msg) const
{
	auto r = world_.say(s, msg);
	if (!r.ok())
		return refused(r.error);

	string line = r.value.event.text;
	if (r.value.audience == 0)
		line += "\n(No one else is here to hear you)";
	Reply out = text(line);
	out.events.push_back(move(r.value.event));
	return out;
}

Reply Dispatcher::shout(SessionId s, const string& msg) const
{
	auto r = world_.shout(s, msg);
	if (!r.ok())
		return refused(r.error);

	// the sender hears it through the global event
	Reply out;
	out.events.push_back(move(r.value));
	return out;
}

Reply Dispatcher::emote(SessionId s, const string& action) const
{
	auto r = world_.emote(s, action);
	if (!r.ok())
		return refused(r.error);

	Reply out = text(r.value.event.text);
	out.events.push_back(move(r.value.event));
	return out;
}

Reply Dispatcher::whisper(SessionId s, const string& rest) const
{
	auto [target, msg] = net::split_verb(rest);
	if (target.empty() || msg.empty())
		return text("Usage: whisper <player> <message>");

	auto r = world_.whisper(s, target, msg);
	if (r.error == WorldError::NO_SUCH_PLAYER)
		return text("Player '" + target + "' is not online.");
	if (!r.ok())
		return refused(r.error);

	Reply out = text("You whisper to " + common::lower(target) + ": " + msg);
	out.events.push_back(move(r.value));
	return out;
}

Reply Dispatcher::get(SessionId s, const string& fragment) const
{
	auto r = world_.take_item(s, fragment);
	switch (r.error)
	{
	case WorldError::NONE:
		break;
	case WorldError::NOT_FOUND:
	{
		string msg = "There's no '" + fragment + "' here to get.";
		if (!r.candidates.empty())
			msg += "\nAvailable items: " + common::join(r.candidates, ", ");
		return text(msg);
	}
	case WorldError::AMBIGUOUS:
		return text("Which do you mean: " + common::join(r.candidates, ", ") + "?");
	default:
		return refused(r.error);
	}

	Reply out = text("You get " + r.value.name + ".");
	out.events.push_back(Event::room(world_.room_of(s), world_.username_of(s) + " gets " + r.value.name + ".", s));
	return out;
}

Reply Dispatcher::drop(SessionId s, const string& fragment) const
{
	auto r = world_.drop_item(s, fragment);
	switch (r.error)
	{
	case WorldError::NONE:
		break;
	case WorldError::NOT_FOUND:
	{
		string msg = "You don't have '" + fragment + "' to drop.\n";
		msg += r.candidates.empty() ? "You're not carrying anything."
			: "You're carrying: " + common::join(r.candidates, ", ");
		return text(msg);
	}
	case WorldError::AMBIGUOUS:
		return text("Which do you mean: " + common::join(r.candidates, ", ") + "?");
	default:
		return refused(r.error);
	}

	Reply out = text("You drop " + r.value.name + ".");
	out.events.push_back(Event::room(world_.room_of(s), world_.username_of(s) + " drops " + r.value.name + ".", s));
	return out;
}

Reply Dispatcher::inventory(SessionId s) const
{
	auto r = world_.inventory(s);
	if (!r.ok())
		return refused(r.error);
	if (r.value.empty())
		return text("You're not carrying anything.");

	string msg = "You are carrying:";
	for (const auto& it : r.value)
		msg += "\n  " + it.name + " - " + it.description;
	return text(msg);
}

Reply Dispatcher::talk(SessionId s, const string& rest) const
{
	auto [npc, keyword] = net::split_verb(rest);
	auto r = world_.talk(s, npc, keyword);
	switch (r.error)
	{
	case WorldError::NONE:
		break;
	case WorldError::NO_SUCH_NPC:
	case WorldError::NOT_IN_ROOM:
	{
		string msg = r.error == WorldError::NOT_IN_ROOM
			? "'" + npc + "' isn't here right now."
			: "There's no '" + npc + "' here to talk to.";
		if (!r.candidates.empty())
			msg += "\nAvailable NPCs: " + common::join(r.candidates, ", ");
		return text(msg);
	}
	case WorldError::AMBIGUOUS:
		return text("Who do you mean: " + common::join(r.candidates, ", ") + "?");
	default:
		return refused(r.error);
	}

	const Dialogue& d = r.value;
	string said = d.npcName + " says: \"" + d.line + "\"";
	string name = world_.username_of(s);
	string seen = name + " talks to " + d.npcName + (d.keyword.empty() ? "" : " about " + d.keyword) + ".\n" + said;

	Reply out = text(said);
	out.events.push_back(Event::room(d.roomId, seen, s));
	return out;
}

Reply Dispatcher::who() const
{
	auto names = world_.who();
	return text("Online players: " + (names.empty() ? string("none") : common::join(names, ", ")));
}
