#include "Logging.hpp"
#include "consoleView.hpp"
#include "playerSetup.hpp"

#include "core/gameState.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace connectk;

//! Parse a decimal integer. Returns nullopt if the whole string is not a number.
static std::optional<int> parseInt(std::string_view text) {
	int value = 0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

//! Optional positional arguments: rows columns runLength.
static GameConfig configFromArgs(int argc, char** argv) {
	GameConfig config;
	int* fields[] = {&config.rows, &config.columns, &config.requiredRunLength};

	for (int i = 1; i < argc && i <= 3; ++i) {
		if (const auto value = parseInt(argv[i])) {
			*fields[i - 1] = *value;
		} else {
			std::cerr << std::format("Ignoring argument '{}': not an integer.\n", argv[i]);
		}
	}
	return config;
}

//! Read moves until the game ends or the input is closed.
//! \returns The message to show when the loop ends.
static std::string play(GameState& state) {
	const auto columns = state.grid().columns();

	drawGrid(state, std::cout);
	std::string line;
	while (true) {
		const auto& player = state.player(state.activePlayer());
		std::cout << std::format("{} - choose a column (1-{}) or q to quit: ", player.name(), columns);
		if (!std::getline(std::cin, line) || line == "q" || line == "quit") {
			return "The game has been closed!";
		}

		const auto column = parseInt(line);
		const auto result = state.submitMove(column ? *column - 1 : -1);
		if (!result.accepted) {
			std::cout << "Please place your coin in a valid column!\n";
			continue;
		}

		drawGrid(state, std::cout);
		switch (result.outcome.status) {
		case GameStatus::Won:
			return std::format("Player {} wins the game!", state.player(*result.outcome.winner).name());
		case GameStatus::Tied:
			return "The game ends in a tragic tie!";
		case GameStatus::InProgress:
			break;
		}
	}
}

int main(int argc, char** argv) {
	const auto config = configFromArgs(argc, argv);
	try {
		config.validate();
	} catch (const InvalidConfigurationError& e) {
		std::cerr << e.what() << std::endl;
		console::Logger().Log(Logging::LogLevel::Error, std::format("[Console] Invalid configuration: {}", e.what()));
		return 1;
	}
	std::cout << std::format("~~~~~~ WELCOME TO CONNECT{}! ~~~~~~~\n", config.requiredRunLength);

	auto colours      = console::availableColours();
	auto firstPlayer  = console::askPlayer(1u, colours, std::cin, std::cout);
	auto secondPlayer = console::askPlayer(2u, colours, std::cin, std::cout);
	std::cout << "The game has opened...\n";

	GameState state{config, std::move(firstPlayer), std::move(secondPlayer)};
	console::Logger().Log(Logging::LogLevel::Info,
	                      std::format("[Console] Game started: {}x{}, {} in a row.", config.rows, config.columns, config.requiredRunLength));

	const auto endMessage = play(state);
	std::cout << endMessage << std::endl;
	console::Logger().Log(Logging::LogLevel::Info, std::format("[Console] {}", endMessage));

	return 0;
}
