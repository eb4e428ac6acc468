#include <kitties/ledger/dna.hpp>

namespace kitties {

    dp::u8 combineDna(dp::u8 dna1, dp::u8 dna2, dp::u8 selector) {
        return static_cast<dp::u8>((~selector & dna1) | (selector & dna2));
    }

    Genome combineGenomes(const Genome &parent1, const Genome &parent2, const Genome &selector) {
        Genome child = {};
        for (dp::usize i = 0; i < GENOME_SIZE; ++i)
            child[i] = combineDna(parent1[i], parent2[i], selector[i]);
        return child;
    }

    Kitty breedKitties(const Kitty &parent1, const Kitty &parent2, const Genome &selector) {
        return Kitty(combineGenomes(parent1.genome, parent2.genome, selector));
    }

    bool isCombinationOf(const Genome &child, const Genome &parent1, const Genome &parent2, const Genome &selector) {
        for (dp::usize i = 0; i < GENOME_SIZE; ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                dp::u8 mask = static_cast<dp::u8>(1u << bit);
                dp::u8 expected = (selector[i] & mask) ? (parent2[i] & mask) : (parent1[i] & mask);
                if ((child[i] & mask) != expected)
                    return false;
            }
        }
        return true;
    }

} // namespace kitties
