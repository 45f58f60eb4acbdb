#pragma once

#include <cstdint>

// ── Cache ───────────────────────────────────────────────────
constexpr int DEFAULT_CACHE_TTL_HOURS    = 24;    // partition goes stale after this
constexpr const char* CACHE_FILE_EXT     = ".yaml";

// ── Search ──────────────────────────────────────────────────
constexpr int DEFAULT_MAX_RESULTS        = 5;      // K: schedules returned per request
constexpr int64_t DEFAULT_NODE_BUDGET    = 200000; // backtracking steps per request

// ── Ranking defaults ────────────────────────────────────────
constexpr double DEFAULT_RATING_WEIGHT      = 1.0;
constexpr double DEFAULT_GPA_WEIGHT         = 1.0;
constexpr double DEFAULT_COMPACTNESS_WEIGHT = 0.01;
constexpr double DEFAULT_PREFERENCE_BOOST   = 2.0;

// ── Clock ───────────────────────────────────────────────────
constexpr int NOON_MINUTES               = 12 * 60;

// ── Term codes (YYYYMM suffixes) ────────────────────────────
constexpr const char* TERM_SPRING        = "01";
constexpr const char* TERM_SUMMER        = "05";
constexpr const char* TERM_FALL          = "08";
constexpr const char* TERM_WINTER        = "12";

// ── Paths ───────────────────────────────────────────────────
constexpr const char* TERMPLAN_HOME_DIR  = ".termplan";
constexpr const char* DEBUG_LOG_NAME     = "termplan_debug.log";

constexpr const char* TERMPLAN_VERSION   = "0.2.0";
