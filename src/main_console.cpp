#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Board.hpp"
#include "core/MoveResolver.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "persist/Serialization.hpp"
#include "persist/StateStore.hpp"

using namespace tilematch::core;
using tilematch::controller::GameController;
using tilematch::controller::InputAction;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--size N] [--seed S] [--save-dir PATH] [--no-save]\n";
}

// Returns std::nullopt (after printing why) on bad arguments.
std::optional<GameConfig> parseArgs(int argc, char* argv[]) {
    GameConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        try {
            if (arg == "--size" && hasValue) {
                config.size = std::stoi(argv[++i]);
            } else if (arg == "--seed" && hasValue) {
                config.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--save-dir" && hasValue) {
                config.saveDirectory = argv[++i];
            } else if (arg == "--no-save") {
                config.persist = false;
            } else {
                std::cerr << "[console] unknown or incomplete argument: " << arg << '\n';
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            std::cerr << "[console] bad value for " << arg << '\n';
            return std::nullopt;
        }
    }

    if (config.size < 3) {
        std::cerr << "[console] board size must be at least 3\n";
        return std::nullopt;
    }
    return config;
}

// One cell is the display value (2^value); consumed tiles show as '*'.
std::string cellText(const Tile& tile) {
    if (tile.consumed()) {
        return "*";
    }
    return std::to_string(std::uint64_t{1} << tile.value);
}

void printBoard(const Board& board, const GameController* controller) {
    const int size = board.size();

    std::cout << '+' << std::string(size * 6, '-') << "+\n";
    for (int y = 0; y < size; ++y) {
        std::cout << '|';
        for (int x = 0; x < size; ++x) {
            const Position p{x, y};
            char left = ' ';
            char right = ' ';
            if (controller) {
                const auto& hint = controller->hint();
                if (hint && (hint->first == p || hint->second == p)) {
                    left = '?';
                    right = '?';
                }
                if (controller->selected() && *controller->selected() == p) {
                    left = '(';
                    right = ')';
                }
                if (controller->cursor() == p) {
                    left = '[';
                    right = ']';
                }
            }
            std::cout << left << std::setw(4) << cellText(board.tileAt(p)) << right;
        }
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(size * 6, '-') << "+\n";
}

void printGame(const GameState& game, const GameController& controller) {
    std::cout << "\n==== TILEMATCH CONSOLE VIEW ====\n";
    std::cout << "Points: " << game.points()
              << " | Best: " << game.highscore()
              << " | Moves: " << game.moves()
              << " | Status: ";

    switch (game.status()) {
    case GameStatus::NotStarted: std::cout << "NotStarted"; break;
    case GameStatus::Running:    std::cout << "Running";    break;
    case GameStatus::GameOver:   std::cout << "GameOver";   break;
    }
    std::cout << '\n';

    printBoard(game.board(), &controller);

    std::cout << "Commands:\n"
              << "  w/a/s/d = move cursor, e = select / swap with selection\n"
              << "  i/j/k/l = swipe up/left/down/right from cursor\n"
              << "  h = hint, n = new game, q = quit\n";
}

// Every snapshot is one frame; the caller's renderer would animate between them.
void playSequence(const std::vector<BoardSnapshot>& sequence) {
    if (sequence.size() <= 1) {
        return;
    }
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        std::cout << "-- step " << (i + 1) << '/' << sequence.size();
        if (sequence[i].points > 0) {
            std::cout << "  +" << sequence[i].points;
        }
        std::cout << '\n';
        printBoard(sequence[i].board, nullptr);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parseArgs(argc, argv);
    if (!config) {
        printUsage(argv[0]);
        return 1;
    }

    GameState game = config->seed ? GameState{config->size, *config->seed}
                                  : GameState{config->size};
    GameController controller{game};

    std::optional<tilematch::persist::StateStore> store;
    if (config->persist) {
        store.emplace(config->saveDirectory);
        game.setHighscore(store->highscore());
    }

    game.start();

    // Resume a stored game only if it has progress and matches the board size
    if (store) {
        if (auto saved = store->loadGame(); saved && saved->points > 0) {
            if (saved->size == config->size) {
                RandomTileSource idSource;
                game.restore(tilematch::persist::toBoard(*saved, idSource),
                             saved->points, saved->moves);
            } else {
                std::cerr << "[console] saved game is " << saved->size << 'x' << saved->size
                          << ", starting a new " << config->size << 'x' << config->size
                          << " game\n";
            }
        }
    }

    std::string cmd;
    printGame(game, controller);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        bool swapped = false;

        switch (c) {
        case 'w': case 'W': controller.handleAction(InputAction::CursorUp);    break;
        case 's': case 'S': controller.handleAction(InputAction::CursorDown);  break;
        case 'a': case 'A': controller.handleAction(InputAction::CursorLeft);  break;
        case 'd': case 'D': controller.handleAction(InputAction::CursorRight); break;
        case 'e': case 'E': swapped = controller.handleAction(InputAction::Select);     break;
        case 'i': case 'I': swapped = controller.handleAction(InputAction::SwipeUp);    break;
        case 'k': case 'K': swapped = controller.handleAction(InputAction::SwipeDown);  break;
        case 'j': case 'J': swapped = controller.handleAction(InputAction::SwipeLeft);  break;
        case 'l': case 'L': swapped = controller.handleAction(InputAction::SwipeRight); break;
        case 'h': case 'H':
            controller.handleAction(InputAction::Hint);
            if (!controller.hint()) {
                std::cout << "No move left.\n";
            }
            break;
        case 'n': case 'N':
            controller.handleAction(InputAction::NewGame);
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        if (swapped) {
            playSequence(game.lastSequence());
        }

        if (store && (swapped || c == 'n' || c == 'N')) {
            store->saveGame(tilematch::persist::toSavedGame(game.board(), game.points(),
                                                           game.moves()));
            if (game.highscore() > store->highscore()) {
                store->setHighscore(game.highscore());
            }
            if (game.reached2048() && !store->hasAchievement()) {
                store->markAchievement();
            }
        }

        printGame(game, controller);

        if (game.status() == GameStatus::GameOver) {
            std::cout << "GAME OVER. Press 'n' to start again or 'q' to quit.\n";
        }
    }

    return 0;
}
