#pragma once

#include "core/connectionTracker.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace connectk {

//! RGB display colour of a player. Opaque to the game rules.
struct Colour {
	std::uint8_t r, g, b;

	bool operator==(const Colour&) const = default;
};

struct NamedColour {
	std::string_view name;
	Colour colour;
};

//! Colours offered to players during setup.
const std::array<NamedColour, 10>& colourPalette();

//! Look up a palette colour by name. Returns nullopt for unknown names.
std::optional<Colour> findColour(std::string_view name);

//! Player setup data passed to a game.
struct PlayerInfo {
	std::string name;
	Colour colour;
};

//! A player taking part in a game. Owns the connections of all tokens the player placed.
class Player {
public:
	Player(PlayerInfo info, std::size_t rows, std::size_t columns);

	const std::string& name() const;
	Colour colour() const;

	ConnectionTracker& tracker();
	const ConnectionTracker& tracker() const;

private:
	PlayerInfo m_info;
	ConnectionTracker m_tracker;
};

} // namespace connectk
