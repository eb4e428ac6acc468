#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <tuple>
#include <vector>

#include "kitties/common/error.hpp"

namespace kitties {

    /// Size of a kitty genome in bytes (128 bits)
    constexpr dp::usize GENOME_SIZE = 16;

    using Genome = dp::Array<dp::u8, GENOME_SIZE>;
    using KittyId = dp::u32;
    using AccountId = std::string;

    enum class KittyGender : dp::u8 {
        Male = 0,
        Female = 1,
    };

    inline std::string kittyGenderToString(KittyGender gender) {
        switch (gender) {
        case KittyGender::Male:
            return "male";
        case KittyGender::Female:
            return "female";
        default:
            return "unknown";
        }
    }

    /// Build a genome from raw bytes
    inline dp::Result<Genome, dp::Error> genomeFromBytes(const std::vector<uint8_t> &bytes) {
        if (bytes.size() != GENOME_SIZE) {
            return dp::Result<Genome, dp::Error>::err(invalid_genome());
        }
        Genome genome = {};
        for (dp::usize i = 0; i < GENOME_SIZE; ++i) {
            genome[i] = bytes[i];
        }
        return dp::Result<Genome, dp::Error>::ok(genome);
    }

    /// Genome filled with a single byte value
    inline Genome genomeFilled(dp::u8 value) {
        Genome genome = {};
        for (dp::usize i = 0; i < GENOME_SIZE; ++i) {
            genome[i] = value;
        }
        return genome;
    }

    inline bool genomesEqual(const Genome &a, const Genome &b) {
        for (dp::usize i = 0; i < GENOME_SIZE; ++i) {
            if (a[i] != b[i])
                return false;
        }
        return true;
    }

    /// Account ids travel through NUL-terminated strings in storage and events
    inline bool isValidAccount(const AccountId &account) { return account.find('\0') == AccountId::npos; }

    /// A kitty: an immutable 128-bit genome. Gender is derived from it, never stored.
    struct Kitty {
        Genome genome = {};

        Kitty() = default;
        inline explicit Kitty(const Genome &g) : genome(g) {}

        /// Construct from a byte buffer; anything but 16 bytes is rejected
        inline static dp::Result<Kitty, dp::Error> fromBytes(const std::vector<uint8_t> &bytes) {
            auto genome = genomeFromBytes(bytes);
            if (!genome.is_ok()) {
                return dp::Result<Kitty, dp::Error>::err(genome.error());
            }
            return dp::Result<Kitty, dp::Error>::ok(Kitty(genome.value()));
        }

        /// Male when the first genome byte is even
        inline KittyGender gender() const {
            return (genome[0] % 2 == 0) ? KittyGender::Male : KittyGender::Female;
        }

        inline std::vector<uint8_t> toBytes() const { return std::vector<uint8_t>(genome.begin(), genome.end()); }

        inline std::string toHex() const { return keylock::keylock::to_hex(toBytes()); }

        inline bool operator==(const Kitty &other) const { return genomesEqual(genome, other.genome); }

        inline bool operator!=(const Kitty &other) const { return !(*this == other); }

        auto members() { return std::tie(genome); }
        auto members() const { return std::tie(genome); }
    };

    /// A kitty together with its id, as returned by owner listings
    struct KittyEntry {
        KittyId id = 0;
        Kitty kitty;
    };

} // namespace kitties
