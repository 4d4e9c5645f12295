#pragma once

#include "core/player.hpp"

#include <iosfwd>
#include <string_view>
#include <vector>

namespace connectk::console {

//! Names of all palette colours, in palette order.
std::vector<std::string_view> availableColours();

//! Ask a player for name and colour until a listed colour is chosen.
//! The chosen colour is removed from colours so the next player cannot pick it.
PlayerInfo askPlayer(unsigned idNum, std::vector<std::string_view>& colours, std::istream& in, std::ostream& out);

} // namespace connectk::console
