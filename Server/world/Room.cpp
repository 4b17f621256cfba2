#include "Room.hpp"
#include <algorithm>

using namespace std;

const string* Room::exit_to(const string& direction) const
{
    for (const auto& [dir, target] : exits)
    {
        if (dir == direction)
            return &target;
    }
    return nullptr;
}

vector<string> Room::exit_names() const
{
    vector<string> out;
    out.reserve(exits.size());
    for (const auto& kv : exits)
        out.push_back(kv.first);
    return out;
}

bool Npc::may_enter(const string& room) const
{
    return find(wander.begin(), wander.end(), room) != wander.end();
}
