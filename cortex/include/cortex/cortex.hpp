#pragma once
// cortex: tiered memory for coding assistants
//
//   Tier A  WorkingMemory        recent conversations and their entities
//   Tier B  KnowledgeGraph       long-lived patterns, tags, relationships
//   Tier C  ContextIntelligence  repository metrics, hotspots, insights
//
// Memory ties the tiers together; Scheduler runs its maintenance.

#include "version.hpp"
#include "types.hpp"
#include "status.hpp"
#include "log.hpp"
#include "config.hpp"
#include "store/record_store.hpp"
#include "scoring.hpp"
#include "working_memory/working_memory.hpp"
#include "knowledge/knowledge_graph.hpp"
#include "context/context_intelligence.hpp"
#include "query_router.hpp"
#include "scheduler.hpp"
#include "memory.hpp"
