#include "core/player.hpp"

#include <algorithm>
#include <utility>

namespace connectk {

static constexpr std::array<NamedColour, 10> kPalette{{
        {"red", {255, 0, 0}},
        {"orange", {240, 127, 14}},
        {"yellow", {255, 255, 0}},
        {"lime", {0, 255, 0}},
        {"green", {10, 87, 10}},
        {"blue", {2, 145, 247}},
        {"indigo", {33, 11, 133}},
        {"purple", {82, 1, 143}},
        {"magenta", {117, 1, 117}},
        {"white", {255, 255, 255}},
}};

const std::array<NamedColour, 10>& colourPalette() {
	return kPalette;
}

std::optional<Colour> findColour(std::string_view name) {
	const auto it = std::find_if(kPalette.begin(), kPalette.end(), [&](const NamedColour& entry) { return entry.name == name; });
	if (it == kPalette.end()) {
		return std::nullopt;
	}
	return it->colour;
}

Player::Player(PlayerInfo info, const std::size_t rows, const std::size_t columns) : m_info(std::move(info)), m_tracker(rows, columns) {
}

const std::string& Player::name() const {
	return m_info.name;
}

Colour Player::colour() const {
	return m_info.colour;
}

ConnectionTracker& Player::tracker() {
	return m_tracker;
}

const ConnectionTracker& Player::tracker() const {
	return m_tracker;
}

} // namespace connectk
