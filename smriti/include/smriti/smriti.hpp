#pragma once
// Smriti: navigable summaries of coding-assistant session transcripts
//
// Pipeline per transcript file:
//   EntryParser → ConversationExtractor → ChapterSegmenter → ConversationCache
// Served from the cache by QueryEngine; NavigationService re-reads files
// for full message bodies.

#include "version.hpp"
#include "config.hpp"
#include "log.hpp"
#include "types.hpp"
#include "entry_parser.hpp"
#include "extractor.hpp"
#include "chapters.hpp"
#include "cache.hpp"
#include "query.hpp"
#include "navigation.hpp"
