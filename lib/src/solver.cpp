// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/solver.hpp>

#include <algorithm>
#include <limits>

#include <cmath>

namespace mcm {

i32 lp_problem::add_row(std::span<const i32>  columns,
                        std::span<const real> coefficients,
                        real                  lo,
                        real                  up)
{
    debug::ensure(columns.size() == coefficients.size());

    const auto row = row_count++;

    for (sz i = 0; i < columns.size(); ++i) {
        rows.emplace_back(row);
        cols.emplace_back(columns[i]);
        values.emplace_back(coefficients[i]);
    }

    row_lower.emplace_back(lo);
    row_upper.emplace_back(up);

    return row;
}

lp_problem build_lp_problem(const model& m)
{
    lp_problem pb;

    pb.row_count = m.metabolite_count();
    pb.col_count = m.reaction_count();

    const auto nnz = m.non_zero_count();
    pb.rows.reserve(nnz);
    pb.cols.reserve(nnz);
    pb.values.reserve(nnz);

    for (i32 j = 0; j < pb.col_count; ++j) {
        for (const auto& c : m.stoichiometry(j)) {
            pb.rows.emplace_back(c.row);
            pb.cols.emplace_back(j);
            pb.values.emplace_back(c.value);
        }

        pb.lower.emplace_back(m.lower_bound(j));
        pb.upper.emplace_back(m.upper_bound(j));
        pb.objective.emplace_back(m.objective(j));
    }

    pb.row_lower.assign(static_cast<sz>(pb.row_count), 0.0);
    pb.row_upper.assign(static_cast<sz>(pb.row_count), 0.0);
    pb.maximize = true;

    return pb;
}

lp_flux_variability::lp_flux_variability(lp_solver& solver,
                                         real       fraction) noexcept
  : m_solver(&solver)
  , m_fraction(fraction)
{}

result<std::vector<flux_range>> lp_flux_variability::analyse(
  const model&         m,
  std::span<const i32> reactions)
{
    auto pb = build_lp_problem(m);

    mcm_auto(optimum, m_solver->solve(pb));
    if (not optimum.feasible())
        return new_error(simulation_errc::flux_variability_failure);

    std::vector<i32>  columns;
    std::vector<real> coefficients;
    for (i32 j = 0; j < pb.col_count; ++j) {
        if (const auto c = pb.objective[static_cast<sz>(j)]; c != 0.0) {
            columns.emplace_back(j);
            coefficients.emplace_back(c);
        }
    }

    if (not columns.empty()) {
        const auto bound =
          optimum.objective - (1.0 - m_fraction) * std::abs(optimum.objective);

        pb.add_row(columns,
                   coefficients,
                   bound,
                   std::numeric_limits<real>::infinity());
    }

    std::vector<flux_range> ret(reactions.size());
    std::fill(pb.objective.begin(), pb.objective.end(), 0.0);

    for (sz i = 0; i < reactions.size(); ++i) {
        const auto j = static_cast<sz>(reactions[i]);

        pb.objective[j] = 1.0;

        pb.maximize = false;
        mcm_auto(low, m_solver->solve(pb));
        if (not low.feasible())
            return new_error(simulation_errc::flux_variability_failure,
                             e_reaction{ m.reaction(reactions[i]) });

        pb.maximize = true;
        mcm_auto(high, m_solver->solve(pb));
        if (not high.feasible())
            return new_error(simulation_errc::flux_variability_failure,
                             e_reaction{ m.reaction(reactions[i]) });

        ret[i] = flux_range{ low.objective, high.objective };
        pb.objective[j] = 0.0;
    }

    return ret;
}

} // namespace mcm
