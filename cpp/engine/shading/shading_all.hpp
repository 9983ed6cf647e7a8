// ============================================================================
// Aggregator Header (Single Include for the Shading Engine)
// File: shading_all.hpp
// ============================================================================
//
// Include this from tools/CLI code to pull the whole public surface.
//
// Note: keep this list explicit (no wildcard).
//

#pragma once

// Core
#include "engine/core/angles.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/row_geometry.hpp"
#include "engine/core/settings.hpp"

// Aligned sequences
#include "engine/series/series.hpp"
#include "engine/series/elementwise.hpp"

// Geometry
#include "engine/shading/masking.hpp"
#include "engine/shading/projection.hpp"
#include "engine/shading/shaded_fraction.hpp"
