// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/glpk-solver.hpp>

#include <memory>
#include <vector>

#include <cmath>

#include <glpk.h>

namespace mcm {

namespace {

struct glp_prob_deleter {
    void operator()(glp_prob* p) const noexcept { glp_delete_prob(p); }
};

using glp_prob_ptr = std::unique_ptr<glp_prob, glp_prob_deleter>;

int bound_type(const real lo, const real up) noexcept
{
    const auto has_lo = std::isfinite(lo);
    const auto has_up = std::isfinite(up);

    if (has_lo and has_up)
        return lo == up ? GLP_FX : GLP_DB;
    if (has_lo)
        return GLP_LO;
    if (has_up)
        return GLP_UP;

    return GLP_FR;
}

real finite_or_zero(const real v) noexcept
{
    return std::isfinite(v) ? v : 0.0;
}

lp_status convert_status(const int status) noexcept
{
    switch (status) {
    case GLP_OPT:
        return lp_status::optimal;
    case GLP_NOFEAS:
    case GLP_INFEAS:
        return lp_status::infeasible;
    case GLP_UNBND:
        return lp_status::unbounded;
    default:
        return lp_status::undefined;
    }
}

} // namespace

glpk_solver::glpk_solver(int time_limit_ms) noexcept
  : m_time_limit_ms(time_limit_ms)
{}

result<lp_solution> glpk_solver::solve(const lp_problem& pb)
{
    lp_solution sol;

    /* GLPK aborts the process on out of range indices. */
    const auto nnz = pb.values.size();
    if (pb.rows.size() != nnz or pb.cols.size() != nnz or
        pb.lower.size() != static_cast<sz>(pb.col_count) or
        pb.upper.size() != static_cast<sz>(pb.col_count) or
        pb.objective.size() != static_cast<sz>(pb.col_count) or
        pb.row_lower.size() != static_cast<sz>(pb.row_count) or
        pb.row_upper.size() != static_cast<sz>(pb.row_count))
        return new_error(simulation_errc::solver_failure);

    for (sz k = 0; k < nnz; ++k)
        if (pb.rows[k] < 0 or pb.rows[k] >= pb.row_count or pb.cols[k] < 0 or
            pb.cols[k] >= pb.col_count)
            return new_error(simulation_errc::solver_failure);

    for (sz i = 0; i < pb.lower.size(); ++i) {
        if (pb.lower[i] > pb.upper[i]) {
            sol.status = lp_status::infeasible;
            return sol;
        }
    }

    glp_prob_ptr lp(glp_create_prob());
    glp_set_obj_dir(lp.get(), pb.maximize ? GLP_MAX : GLP_MIN);

    if (pb.row_count > 0)
        glp_add_rows(lp.get(), pb.row_count);

    if (pb.col_count > 0)
        glp_add_cols(lp.get(), pb.col_count);

    for (i32 i = 0; i < pb.row_count; ++i) {
        const auto lo = pb.row_lower[static_cast<sz>(i)];
        const auto up = pb.row_upper[static_cast<sz>(i)];

        glp_set_row_bnds(lp.get(),
                         i + 1,
                         bound_type(lo, up),
                         finite_or_zero(lo),
                         finite_or_zero(up));
    }

    for (i32 j = 0; j < pb.col_count; ++j) {
        const auto lo = pb.lower[static_cast<sz>(j)];
        const auto up = pb.upper[static_cast<sz>(j)];

        glp_set_col_bnds(lp.get(),
                         j + 1,
                         bound_type(lo, up),
                         finite_or_zero(lo),
                         finite_or_zero(up));
        glp_set_obj_coef(lp.get(), j + 1, pb.objective[static_cast<sz>(j)]);
    }

    /* GLPK arrays are one based: element 0 is unused. */
    std::vector<int> ia(nnz + 1u, 0);
    std::vector<int> ja(nnz + 1u, 0);
    std::vector<double> ar(nnz + 1u, 0.0);

    for (sz k = 0; k < nnz; ++k) {
        ia[k + 1u] = pb.rows[k] + 1;
        ja[k + 1u] = pb.cols[k] + 1;
        ar[k + 1u] = pb.values[k];
    }

    glp_load_matrix(
      lp.get(), static_cast<int>(nnz), ia.data(), ja.data(), ar.data());

    glp_smcp parm;
    glp_init_smcp(&parm);
    parm.msg_lev  = GLP_MSG_OFF;
    parm.presolve = GLP_ON;
    if (m_time_limit_ms > 0)
        parm.tm_lim = m_time_limit_ms;

    switch (glp_simplex(lp.get(), &parm)) {
    case 0:
        break;
    case GLP_ENOPFS:
        sol.status = lp_status::infeasible;
        return sol;
    case GLP_ENODFS:
        sol.status = lp_status::unbounded;
        return sol;
    default:
        // Time or iteration limit, singular or ill conditioned basis.
        sol.status = lp_status::undefined;
        return sol;
    }

    sol.status = convert_status(glp_get_status(lp.get()));
    if (sol.status == lp_status::optimal) {
        sol.objective = glp_get_obj_val(lp.get());
        sol.primal.resize(static_cast<sz>(pb.col_count));

        for (i32 j = 0; j < pb.col_count; ++j)
            sol.primal[static_cast<sz>(j)] = glp_get_col_prim(lp.get(), j + 1);
    }

    return sol;
}

} // namespace mcm
