#include "core/gameConfig.hpp"

namespace connectk {

InvalidConfigurationError::InvalidConfigurationError(const std::string& message) : std::invalid_argument(message) {
}

void GameConfig::validate() const {
	std::string message;
	if (rows <= 0) {
		message += "Please enter a value for the number of rows that is greater than 0. ";
	}
	if (columns <= 0) {
		message += "Please enter a value for the number of columns that is greater than 0. ";
	}
	if (requiredRunLength <= 0) {
		message += "Please enter a value for the required run length that is greater than 0. ";
	}

	if (!message.empty()) {
		message.pop_back();
		throw InvalidConfigurationError(message);
	}
}

} // namespace connectk
