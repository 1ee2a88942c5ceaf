#pragma once
// context.h -- Per-call analysis context: borrowed pool, optional SEE cache and thresholds.

#include "analysisparams.h"

namespace motif {

class ScratchPool;
struct SeeCache;

struct AnalysisContext {
  ScratchPool* pool{nullptr};
  SeeCache* see_cache{nullptr};
  AnalysisParams params{};
};

}  // namespace motif
