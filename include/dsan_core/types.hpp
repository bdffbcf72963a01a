#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. dsan_core/types/file.hpp),
// users can simply do `#include "dsan_core/types.hpp"`.
//
#include "dsan_core/types/file.hpp"
#include "dsan_core/types/sanitize_result.hpp"
