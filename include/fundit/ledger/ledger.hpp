#pragma once

// Ledger-side building blocks: records, ownership, balances, earnings, entity locks

#include "fundit/ledger/balance_ledger.hpp"
#include "fundit/ledger/earnings_registry.hpp"
#include "fundit/ledger/guard.hpp"
#include "fundit/ledger/lock_table.hpp"
#include "fundit/ledger/records.hpp"
