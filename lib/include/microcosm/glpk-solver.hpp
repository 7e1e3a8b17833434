// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_GLPK_SOLVER_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_GLPK_SOLVER_HPP

#include <microcosm/solver.hpp>

namespace mcm {

/**
 * @c lp_solver backend using the GLPK primal simplex with presolve. GLPK
 * terminal output is disabled.
 *
 * Status mapping: @c GLP_OPT gives @c lp_status::optimal, no primal
 * feasible solution gives @c lp_status::infeasible, @c GLP_UNBND gives @c
 * lp_status::unbounded, anything else @c lp_status::undefined. A problem
 * with inconsistent sizes or out of range indices is rejected with @c
 * simulation_errc::solver_failure.
 */
class glpk_solver final : public lp_solver
{
public:
    explicit glpk_solver(int time_limit_ms = 0) noexcept;

    result<lp_solution> solve(const lp_problem& pb) override;

private:
    int m_time_limit_ms = 0;
};

} // namespace mcm

#endif
