#pragma once

// High-level Kitties facade
// Composes ledger and storage modules

#include "kitties/common/error.hpp"
#include "kitties/ledger/ledger.hpp"
#include "kitties/storage/file_store.hpp"
#include "kitties/storage/memory_store.hpp"
#include "kitties/storage/sqlite_store.hpp"
