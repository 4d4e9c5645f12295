#include "playerSetup.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>
#include <istream>
#include <ostream>
#include <string>

namespace connectk::console {

static std::string listColours(const std::vector<std::string_view>& colours) {
	std::string list;
	for (const auto colour: colours) {
		if (!list.empty())
			list += ", ";
		list += colour;
	}
	return std::format("[{}]", list);
}

std::vector<std::string_view> availableColours() {
	std::vector<std::string_view> names;
	for (const auto& entry: colourPalette()) {
		names.push_back(entry.name);
	}
	return names;
}

PlayerInfo askPlayer(const unsigned idNum, std::vector<std::string_view>& colours, std::istream& in, std::ostream& out) {
	std::string name;
	out << std::format("Player {} - Please type your name: ", idNum);
	std::getline(in, name);

	std::string colour;
	out << std::format("Choose a colour from \n{}: ", listColours(colours));
	while (std::getline(in, colour) && std::find(colours.begin(), colours.end(), colour) == colours.end()) {
		out << std::format("Please choose a valid colour from \n{}: ", listColours(colours));
	}

	const auto it = std::find(colours.begin(), colours.end(), colour);
	if (it == colours.end()) {
		// Input closed before a valid choice. Take the first remaining colour.
		colour = std::string(colours.front());
		Logger().Log(Logging::LogLevel::Warning, std::format("[Console] No colour chosen for player {}. Using '{}'.", idNum, colour));
	}
	colours.erase(std::find(colours.begin(), colours.end(), colour));

	Logger().Log(Logging::LogLevel::Info, std::format("[Console] Player {} is '{}' playing {}.", idNum, name, colour));
	return PlayerInfo{name, *findColour(colour)};
}

} // namespace connectk::console
