#pragma once

// QuotaWatch: KPI aggregation and projection for LLM usage quotas
//
// Rolls per-hour token/cost records into calendar-aligned windows,
// measures them against weekly caps and spend baselines, extrapolates the
// current week, and publishes the result as one immutable snapshot.

// Core
#include "quotawatch/types.hpp"
#include "quotawatch/exceptions.hpp"
#include "quotawatch/config.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/rate_table.hpp"
#include "quotawatch/calibration.hpp"
#include "quotawatch/calibration_store.hpp"
#include "quotawatch/snapshot.hpp"
#include "quotawatch/engine.hpp"
#include "quotawatch/monitor.hpp"
#include "quotawatch/report.hpp"

// Computation stages
#include "quotawatch/aggregator.hpp"
#include "quotawatch/threshold.hpp"
#include "quotawatch/quota_calculator.hpp"
#include "quotawatch/projection.hpp"
#include "quotawatch/snapshot_builder.hpp"

// Usage sources
#include "quotawatch/usage_source.hpp"
#include "quotawatch/sources/ccusage_source.hpp"
#include "quotawatch/sources/transcript_source.hpp"
#include "quotawatch/sources/sqlite_history.hpp"
#include "quotawatch/sources/composite_source.hpp"
