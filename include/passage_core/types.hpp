#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. passage_core/types/chunk.hpp),
// users can simply do `#include "passage_core/types.hpp"`.
//
#include "passage_core/types/document.hpp"
#include "passage_core/types/chunk.hpp"
#include "passage_core/types/retrieval.hpp"
