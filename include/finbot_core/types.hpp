#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. finbot_core/types/chunk.hpp),
// users can simply do `#include "finbot_core/types.hpp"`.
//
#include "finbot_core/types/chunk.hpp"
#include "finbot_core/types/classification.hpp"
