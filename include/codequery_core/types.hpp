#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. codequery_core/types/chunk.hpp),
// users can simply do `#include "codequery_core/types.hpp"`.
//
#include "codequery_core/types/answer.hpp"
#include "codequery_core/types/chunk.hpp"
#include "codequery_core/types/document.hpp"
#include "codequery_core/types/embedding_strategy.hpp"
