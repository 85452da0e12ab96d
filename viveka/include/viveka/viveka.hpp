#pragma once
// Viveka: Knowledge-base deduplication and curation
//
// Similarity graphs per category, drift triads, Louvain communities,
// a bucketed decision policy, interactive review with a write-ahead
// audit log, and an unattended convergence loop.

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "config.hpp"
#include "providers.hpp"
#include "embedding_index.hpp"
#include "neighbor_file.hpp"
#include "store.hpp"
#include "sqlite_store.hpp"
#include "item_pool.hpp"
#include "audit.hpp"
#include "graph.hpp"
#include "union_find.hpp"
#include "triads.hpp"
#include "community.hpp"
#include "policy.hpp"
#include "auto_dedup.hpp"
#include "adjudicator.hpp"
#include "session_state.hpp"
#include "review_session.hpp"
#include "convergence.hpp"
#include "report.hpp"
