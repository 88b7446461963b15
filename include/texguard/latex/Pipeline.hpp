//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/texguard/latex/Pipeline.hpp
// Purpose: Stable façade exposing the document integrity pipeline.
// Key invariants: Re-exports the public latex headers only; scanning helpers
//                 stay internal.
// Ownership/Lifetime: See the forwarded headers.
// Links: docs/codemap.md
#pragma once

#include "latex/Document.hpp"
#include "latex/EnvironmentBalance.hpp"
#include "latex/InputExpansion.hpp"
#include "latex/Issue.hpp"
#include "latex/LogClassifier.hpp"
#include "latex/RepairEngine.hpp"
#include "latex/Sanitizer.hpp"
#include "latex/Segmenter.hpp"
#include "latex/Span.hpp"
#include "latex/SubmissionChecks.hpp"
#include "latex/SubstitutionTable.hpp"

/// @file include/texguard/latex/Pipeline.hpp
/// @brief Aggregated public header for segmentation, sanitization, balance
///        validation, log classification and repair.
