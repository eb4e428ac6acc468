#pragma once

#include "allocator.hpp"
#include "dna.hpp"
#include "engine.hpp"
#include "entropy.hpp"
#include "event.hpp"
#include "kitty.hpp"

namespace kitties {
    // Aggregates ledger headers under kitties
}
