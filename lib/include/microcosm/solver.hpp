// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_SOLVER_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_SOLVER_HPP

#include <microcosm/model.hpp>

#include <span>
#include <vector>

namespace mcm {

/**
 * A linear program in column bounded form: maximize (or minimize) @c c.x
 * under @c row_lower <= A.x <= row_upper and @c lower <= x <= upper. The
 * matrix @c A is stored as triplets (@c rows, @c cols, @c values) with
 * zero based indices.
 */
struct lp_problem {
    i32 row_count = 0;
    i32 col_count = 0;

    std::vector<i32>  rows;
    std::vector<i32>  cols;
    std::vector<real> values;

    std::vector<real> row_lower;
    std::vector<real> row_upper;

    std::vector<real> lower;
    std::vector<real> upper;
    std::vector<real> objective;

    bool maximize = true;

    //! Append the row @a lo <= sum coefficients[i] * x[columns[i]] <= @a up.
    i32 add_row(std::span<const i32>  columns,
                std::span<const real> coefficients,
                real                  lo,
                real                  up);
};

//! Steady state flux balance problem of @a m: @c S.v = 0, reaction bounds
//! and objective, maximization.
lp_problem build_lp_problem(const model& m);

enum class lp_status : u8 {
    optimal,
    infeasible,
    unbounded,
    undefined,
};

static inline constexpr const std::string_view lp_status_names[] = {
    "optimal",
    "infeasible",
    "unbounded",
    "undefined",
};

struct lp_solution {
    lp_status         status    = lp_status::undefined;
    real              objective = 0.0;
    std::vector<real> primal;

    //! Only an optimal solution is feasible.
    bool feasible() const noexcept { return status == lp_status::optimal; }
};

//! Interface to a linear program solver.
class lp_solver
{
public:
    virtual ~lp_solver() noexcept = default;

    /**
     * Solve @a pb. A non optimal status is not an error, errors are kept
     * for solver failures (bad problem, internal error).
     */
    virtual result<lp_solution> solve(const lp_problem& pb) = 0;
};

struct flux_range {
    real min = 0.0;
    real max = 0.0;
};

//! Interface to a flux variability analysis.
class flux_variability
{
public:
    virtual ~flux_variability() noexcept = default;

    /**
     * Compute the minimum and maximum fluxes of the @a reactions of @a m
     * under a near optimal objective constraint.
     */
    virtual result<std::vector<flux_range>> analyse(
      const model&         m,
      std::span<const i32> reactions) = 0;
};

/**
 * Flux variability computed with any @c lp_solver: solve @a m, add the
 * constraint @c c.v >= fraction * optimum, then minimize and maximize each
 * reaction.
 */
class lp_flux_variability final : public flux_variability
{
public:
    explicit lp_flux_variability(lp_solver& solver,
                                 real       fraction = 0.99) noexcept;

    result<std::vector<flux_range>> analyse(
      const model&         m,
      std::span<const i32> reactions) override;

private:
    lp_solver* m_solver;
    real       m_fraction;
};

} // namespace mcm

#endif
