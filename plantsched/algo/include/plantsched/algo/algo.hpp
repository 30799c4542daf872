#pragma once

/// @defgroup algo Algo Library
/// @brief Day-by-day dispatch of orders onto machine units and operators.
///
/// The algo library implements the scheduling loop on top of the core
/// plant model: work planning (route, ETC, crew), earliest-start unit
/// selection, operator admission and retry bookkeeping. Depends on core
/// only.

// Convenience header for libplantsched-algo
// Includes all public headers for the dispatch algorithm

#include <plantsched/algo/error.hpp>
#include <plantsched/algo/dispatcher.hpp>
