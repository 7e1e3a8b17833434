// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_SIMULATION_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_SIMULATION_HPP

#include <microcosm/checkpoint.hpp>
#include <microcosm/global.hpp>
#include <microcosm/io.hpp>
#include <microcosm/solver.hpp>

#include <functional>
#include <string>
#include <vector>

namespace mcm {

/**
 * Solve the constrained model @a m and store the outcome into @a out. A non
 * optimal solve is recorded infeasible and is not an error, as are the
 * numerical failures of the solver (@c simulation_errc::solver_failure) and
 * of the flux variability analysis
 * (@c simulation_errc::flux_variability_failure). If @a fva is not
 * null, the flux ranges of the fecal exchanges and of their paired diet
 * exchanges are stored into the @c net_production and @c net_uptake
 * profiles, indexed like @a exchanges. Unknown fecal exchange identifiers
 * are appended to @a exchanges.
 */
status solve_scenario(const model&              m,
                      lp_solver&                solver,
                      flux_variability*         fva,
                      std::vector<std::string>& exchanges,
                      scenario_result&          out);

//! Called after each simulated sample, once its results are written to the
//! intermediate checkpoint.
using sample_observer = std::function<void(const sample_result& result)>;

/**
 * Run the dietary scenarios of every sample of @a params.
 *
 * For each sample, the community model is loaded from @a store, the base
 * rules are applied and the rich scenario is solved as a presolve. The
 * standard scenario applies @a diet and the optional personalized scenario
 * the diet returned by @a personalized. An infeasible scenario is recorded
 * and the batch continues. If the presolve is infeasible, the diet scenarios
 * of the sample are recorded infeasible without solving.
 *
 * The intermediate checkpoint is written after each sample, the final one
 * at the end. Unless @c force_repeat is set, a valid final checkpoint is
 * returned without solving and valid samples of a previous run are reused.
 * The @a observer is called after each simulated sample, for example to
 * flush @a jn.
 */
result<checkpoint_state> run_batch(
  const batch_parameters&         params,
  model_store&                    store,
  lp_solver&                      solver,
  flux_variability&               fva,
  const diet_table&               diet,
  journal_handler&                jn,
  const personalized_diet_source& personalized = {},
  const sample_observer&          observer     = {});

} // namespace mcm

#endif
