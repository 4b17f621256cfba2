#include "Database.hpp"

using namespace std;

namespace
{
	Room make_room(string id, string name, string description, vector<pair<string, string>> exits)
	{
		Room r;
		r.roomId = move(id);
		r.name = move(name);
		r.description = move(description);
		r.exits = move(exits);
		return r;
	}

	Item make_item(string id, string name, string description, string roomId)
	{
		return { move(id), move(name), move(description), { OwnerKind::ROOM, move(roomId) } };
	}
}

WorldData seed_world()
{
	WorldData w;

	w.rooms.push_back(make_room("alamo_plaza", "The Alamo Plaza",
		"Stone walls surround you in this historic courtyard. Tourists move in and out, taking photos of the famous mission. "
		"The limestone facade of the Alamo Chapel stands solemnly to the north.",
		{ { "east", "riverwalk_north" }, { "south", "southtown" } }));
	w.rooms.push_back(make_room("riverwalk_north", "River Walk North",
		"The water glistens as barges float past carrying tourists. Cafes line the banks with outdoor seating under colorful umbrellas. "
		"The sound of mariachi music drifts from nearby restaurants.",
		{ { "west", "alamo_plaza" }, { "south", "riverwalk_south" }, { "north", "pearl" } }));
	w.rooms.push_back(make_room("riverwalk_south", "River Walk South",
		"Cypress trees lean over the quiet waters here. Historic bridges arch overhead while paddleboats drift lazily by. "
		"Street vendors sell churros and cold drinks to passing visitors.",
		{ { "north", "riverwalk_north" }, { "west", "mission_san_jose" } }));
	w.rooms.push_back(make_room("pearl", "The Pearl",
		"The old brewery has been transformed into a vibrant district. Families gather in the central plaza while live music echoes "
		"from the amphitheater. Artisan shops and restaurants fill the converted buildings.",
		{ { "south", "riverwalk_north" }, { "east", "tower_americas" } }));
	w.rooms.push_back(make_room("tower_americas", "Tower of the Americas",
		"The 750-foot tower stretches high above the city skyline. Built for the 1968 World's Fair, it offers commanding views of "
		"San Antonio. The HemisFair Park spreads out below with its geometric walkways.",
		{ { "west", "pearl" } }));
	w.rooms.push_back(make_room("mission_san_jose", "Mission San Jose",
		"Known as the \"Queen of the Missions,\" this 18th-century Spanish colonial church stands majestically. The Rose Window "
		"carved in limestone catches the light beautifully. Native American and Spanish cultures blend in the surrounding grounds.",
		{ { "east", "riverwalk_south" }, { "north", "southtown" } }));
	w.rooms.push_back(make_room("southtown", "Southtown",
		"Colorful murals cover the walls of this artistic neighborhood. Hip cafes and galleries mix with traditional Mexican "
		"restaurants. The energy is young and creative, with street art around every corner.",
		{ { "north", "alamo_plaza" }, { "south", "mission_san_jose" } }));

	Npc maria;
	maria.npcId = "alamo_guide";
	maria.name = "Maria, the Tour Guide";
	maria.description = "A friendly woman in a park ranger uniform with a warm smile.";
	maria.roomId = "alamo_plaza";
	maria.responses = {
		{ "default", "Welcome to the Alamo! This sacred ground holds the memory of Texas heroes. Would you like to know about the history?" },
		{ "history", "In 1836, brave defenders including Davy Crockett and Jim Bowie made their last stand here. Remember the Alamo!" },
		{ "alamo", "The Alamo Chapel you see here is all that remains of the original mission. It's been carefully preserved since 1836." },
		{ "texas", "Texas fought for independence from Mexico. The Battle of the Alamo was a pivotal moment in our history." },
		{ "hello", "Hola! Welcome to San Antonio's most historic site!" },
	};
	w.npcs.push_back(move(maria));

	Npc carlos;
	carlos.npcId = "mariachi_carlos";
	carlos.name = "Carlos, the Mariachi";
	carlos.description = "A cheerful musician in traditional charro outfit with a guitar slung over his shoulder.";
	carlos.roomId = "riverwalk_north";
	carlos.responses = {
		{ "default", "Buenas! I play music here every day. The River Walk comes alive with our songs!" },
		{ "music", "We play traditional Mexican music - rancheras, boleros, and corridos. Music is the soul of San Antonio!" },
		{ "guitar", "This guitar has been in my family for three generations. Every scratch tells a story." },
		{ "song", "La Llorona, la Llorona, de azul celeste - would you like to hear more?" },
		{ "riverwalk", "The River Walk is magical at night when all the lights reflect on the water. Perfect for serenades!" },
	};
	carlos.wander = { "riverwalk_north", "riverwalk_south" };
	w.npcs.push_back(move(carlos));

	Npc isabella;
	isabella.npcId = "pearl_chef";
	isabella.name = "Chef Isabella";
	isabella.description = "An energetic chef with flour-dusted apron, carrying fresh ingredients from the farmers market.";
	isabella.roomId = "pearl";
	isabella.responses = {
		{ "default", "Welcome to The Pearl! This place has the best ingredients in all of San Antonio. Are you hungry?" },
		{ "food", "We have amazing tacos, barbacoa, puffy tacos - everything made with love and fresh ingredients!" },
		{ "tacos", "Puffy tacos are a San Antonio specialty! The shells are fried fresh and puffed up like little pillows." },
		{ "pearl", "This used to be a brewery, now it's a food paradise! Local farmers bring their best produce here." },
		{ "cooking", "The secret to good Mexican food is fresh ingredients and cooking with your heart, not just your hands." },
	};
	w.npcs.push_back(move(isabella));

	Npc miguel;
	miguel.npcId = "mission_padre";
	miguel.name = "Father Miguel";
	miguel.description = "An elderly priest in brown robes, tending to the mission gardens with gentle care.";
	miguel.roomId = "mission_san_jose";
	miguel.responses = {
		{ "default", "Peace be with you, my child. Mission San Jose has welcomed visitors for over 250 years." },
		{ "mission", "This is the Queen of Missions, built in 1720. We've preserved the faith and culture of our ancestors." },
		{ "rose", "Ah, the Rose Window! Carved by Pedro Huizar for his beloved Rosa. Love and devotion made eternal in stone." },
		{ "god", "God's house is always open. Here, Spanish and indigenous cultures learned to live as one." },
		{ "peace", "In these walls, you'll find peace that has lasted centuries. Take a moment to reflect." },
	};
	w.npcs.push_back(move(miguel));

	Npc diego;
	diego.npcId = "street_artist";
	diego.name = "Diego, the Muralist";
	diego.description = "A young artist with paint-stained hands, working on a colorful mural depicting local culture.";
	diego.roomId = "southtown";
	diego.responses = {
		{ "default", "Orale! You like the murals? Southtown is where San Antonio's artistic soul lives and breathes." },
		{ "art", "Every wall here tells a story - our history, our dreams, our struggles. Art is how we speak our truth." },
		{ "mural", "This one shows the blending of cultures - Mexican, Native American, and Texan. We're all mixed together here." },
		{ "culture", "San Antonio is a mestizo city - mixed heritage, mixed flavors, mixed dreams. That's what makes us beautiful." },
		{ "southtown", "This neighborhood is changing fast, but we're fighting to keep our cultura alive through art." },
	};
	w.npcs.push_back(move(diego));

	w.items.push_back(make_item("alamo_brochure", "a historic brochure",
		"A colorful brochure about the Battle of the Alamo with pictures of the heroes.", "alamo_plaza"));
	w.items.push_back(make_item("guitar_pick", "a tortoiseshell guitar pick",
		"A well-worn guitar pick made of tortoiseshell, dropped by a mariachi musician.", "riverwalk_north"));
	w.items.push_back(make_item("churros", "fresh churros",
		"Warm, crispy churros dusted with cinnamon sugar. They smell heavenly.", "riverwalk_south"));
	w.items.push_back(make_item("recipe_card", "a handwritten recipe card",
		"A stained index card with a recipe for \"Abuela's Perfect Puffy Tacos\" in elegant cursive.", "pearl"));
	w.items.push_back(make_item("mission_bell", "a small mission bell",
		"A tiny brass bell replica of those that once called the faithful to prayer.", "mission_san_jose"));
	w.items.push_back(make_item("paint_brush", "a paint-stained brush",
		"An artist's brush with dried acrylic paint in vibrant colors of red, blue, and yellow.", "southtown"));
	w.items.push_back(make_item("tower_postcard", "a vintage postcard",
		"A postcard from the 1968 World's Fair showing the Tower of the Americas in its full glory.", "tower_americas"));

	return w;
}
