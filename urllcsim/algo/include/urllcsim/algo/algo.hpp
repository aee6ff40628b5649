#pragma once

/// @defgroup algo Algo Library
/// @brief Radio model, devices, base station and scheduling policies.
///
/// The algo library models one URLLC cell on top of the core engine:
/// Poisson packet sources with per-packet latency budgets, a base station
/// sharing a fixed pool of resource blocks, a SINR/Shannon channel with
/// bursty interference, and seven interchangeable scheduling policies.
/// Depends on core only.

/// @defgroup algo_policies Policies
/// @ingroup algo
/// @brief Dispatch ordering and preemption strategies.

/// @defgroup algo_metrics Metrics
/// @ingroup algo
/// @brief Per-device and per-run statistics.

#include <urllcsim/algo/error.hpp>
#include <urllcsim/algo/packet.hpp>
#include <urllcsim/algo/channel_model.hpp>
#include <urllcsim/algo/resource_block.hpp>
#include <urllcsim/algo/waiting_set.hpp>
#include <urllcsim/algo/scheduling_policy.hpp>
#include <urllcsim/algo/preemptive_priority_policy.hpp>
#include <urllcsim/algo/non_preemptive_priority_policy.hpp>
#include <urllcsim/algo/round_robin_policy.hpp>
#include <urllcsim/algo/edf_policy.hpp>
#include <urllcsim/algo/proportional_fair_policy.hpp>
#include <urllcsim/algo/hybrid_edf_policy.hpp>
#include <urllcsim/algo/qci_priority_policy.hpp>
#include <urllcsim/algo/device.hpp>
#include <urllcsim/algo/base_station.hpp>
#include <urllcsim/algo/metrics.hpp>
#include <urllcsim/algo/simulation_config.hpp>
#include <urllcsim/algo/simulation.hpp>
