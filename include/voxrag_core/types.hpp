#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. voxrag_core/types/document.hpp),
// users can simply do `#include "voxrag_core/types.hpp"`.
//
#include "voxrag_core/types/chunk.hpp"
#include "voxrag_core/types/conversation.hpp"
#include "voxrag_core/types/document.hpp"
