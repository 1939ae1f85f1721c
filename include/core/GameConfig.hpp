#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tilematch::core {

struct GameConfig {
    int size{8};                        // board is size x size
    std::optional<std::uint32_t> seed;  // unset = seed from std::random_device

    std::string saveDirectory{".tilematch"}; // StateStore root
    bool persist{true};                       // false = never touch the disk
};

} // namespace tilematch::core
