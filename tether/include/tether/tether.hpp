#pragma once
// Tether: persistent memories and tasks, linked by relevance
//
// - Document store: per-project markdown documents with JSON front matter
// - Index: in-memory view with filters, tags and tolerant id lookup
// - Ranker and linker: scored memory/task edges
// - Automation: rule-driven task status changes and advisories
// - Dedup: near-duplicate memory merging
// - Service: one locked facade over all of the above

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "document.hpp"
#include "document_store.hpp"
#include "text.hpp"
#include "tag_index.hpp"
#include "id_resolver.hpp"
#include "index.hpp"
#include "transitions.hpp"
#include "classifier.hpp"
#include "ranker.hpp"
#include "linker.hpp"
#include "automation.hpp"
#include "dedup.hpp"
#include "scheduler.hpp"
#include "service.hpp"
