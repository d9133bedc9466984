// src/ess/model_factory.hpp
#pragma once

#include "ess/battery_config.hpp"
#include "ess/battery_model.hpp"
#include "ess/transition_history.hpp"

#include <memory>

namespace ess {

/**
 * Build the battery model for cfg.chemistry:
 *   linear    -> LinearModel
 *   empirical -> EmpiricalModel
 *   nmc/nca/lfp -> TableModel over cfg.table_path
 *
 * The SOH curve at cfg.soh_curve_path is attached when set.
 *
 * @throws std::invalid_argument on an invalid configuration
 * @throws TableLoadError if a table or curve cannot be loaded
 */
std::unique_ptr<BatteryModel> make_battery_model(const BatteryConfig& cfg,
                                                 TransitionHistory* history = nullptr);

} // namespace ess
