#pragma once

#include "kitty.hpp"

namespace kitties {

    /// Bitwise multiplexer over one genome byte: selector bit 0 takes the bit
    /// from `dna1`, selector bit 1 takes it from `dna2`.
    dp::u8 combineDna(dp::u8 dna1, dp::u8 dna2, dp::u8 selector);

    /// Apply combineDna to each of the 16 byte positions independently
    Genome combineGenomes(const Genome &parent1, const Genome &parent2, const Genome &selector);

    /// Breed two kitties under a selector genome
    Kitty breedKitties(const Kitty &parent1, const Kitty &parent2, const Genome &selector);

    /// True when every bit of `child` comes from `parent1` where `selector` is 0
    /// and from `parent2` where it is 1
    bool isCombinationOf(const Genome &child, const Genome &parent1, const Genome &parent2, const Genome &selector);

} // namespace kitties
