#pragma once

#include <datapod/datapod.hpp>

namespace kitties {

    // ===========================================
    // Kitties-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_ID_OVERFLOW = 100;
    constexpr dp::u32 ERR_KITTY_NOT_FOUND = 101;
    constexpr dp::u32 ERR_SAME_GENDER = 102;
    constexpr dp::u32 ERR_INVALID_GENOME = 103;
    constexpr dp::u32 ERR_ENTROPY_FAILED = 104;
    constexpr dp::u32 ERR_STORE_FAILED = 105;
    constexpr dp::u32 ERR_STORE_NOT_OPEN = 106;
    constexpr dp::u32 ERR_NOT_INITIALIZED = 107;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 108;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error id_overflow(const dp::String &msg = "Kitty id counter overflow") {
        return dp::Error{ERR_ID_OVERFLOW, msg};
    }

    inline dp::Error kitty_not_found(const dp::String &msg = "Kitty not found for owner") {
        return dp::Error{ERR_KITTY_NOT_FOUND, msg};
    }

    inline dp::Error same_gender(const dp::String &msg = "Parents have the same gender") {
        return dp::Error{ERR_SAME_GENDER, msg};
    }

    inline dp::Error invalid_genome(const dp::String &msg = "Genome must be exactly 16 bytes") {
        return dp::Error{ERR_INVALID_GENOME, msg};
    }

    inline dp::Error entropy_failed(const dp::String &msg = "Entropy derivation failed") {
        return dp::Error{ERR_ENTROPY_FAILED, msg};
    }

    inline dp::Error store_failed(const dp::String &msg = "Store operation failed") {
        return dp::Error{ERR_STORE_FAILED, msg};
    }

    inline dp::Error store_not_open(const dp::String &msg = "Store not open") {
        return dp::Error{ERR_STORE_NOT_OPEN, msg};
    }

    inline dp::Error not_initialized(const dp::String &msg = "Engine not initialized") {
        return dp::Error{ERR_NOT_INITIALIZED, msg};
    }

    inline dp::Error deserialization_failed(const dp::String &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, msg};
    }

    // ===========================================
    // Error classification
    // ===========================================

    inline bool isIdOverflow(const dp::Error &error) { return error.code == ERR_ID_OVERFLOW; }

    inline bool isKittyNotFound(const dp::Error &error) { return error.code == ERR_KITTY_NOT_FOUND; }

    inline bool isSameGender(const dp::Error &error) { return error.code == ERR_SAME_GENDER; }

} // namespace kitties
