#pragma once

// Fundit: campaign custody and transfer coordination
// Composes ledger, rail, coordinator and storage modules

#include "fundit/common/config.hpp"
#include "fundit/common/error.hpp"
#include "fundit/common/types.hpp"
#include "fundit/engine.hpp"
#include "fundit/ledger/ledger.hpp"
#include "fundit/rail/gateway.hpp"
#include "fundit/rail/simulated_rail.hpp"
#include "fundit/storage/file_store.hpp"
#include "fundit/storage/memory_store.hpp"
#include "fundit/storage/sqlite_store.hpp"
