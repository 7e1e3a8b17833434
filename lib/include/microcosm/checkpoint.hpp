// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_CHECKPOINT_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_CHECKPOINT_HPP

#include <microcosm/global.hpp>

#include <array>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstdio>

namespace mcm {

/**
 * Net fluxes of an exchanged metabolite. In @c net_production, @c diet is
 * the minimum diet flux and @c fecal the maximum fecal flux. In @c
 * net_uptake, @c diet is the maximum diet flux and @c fecal the minimum
 * fecal flux. Metabolites absent from a sample model are NaN.
 */
struct net_flux {
    real diet  = std::numeric_limits<real>::quiet_NaN();
    real fecal = std::numeric_limits<real>::quiet_NaN();
};

struct scenario_result {
    bool                attempted = false;
    bool                feasible  = false;
    std::optional<real> objective;

    //! Indexed like @c checkpoint_state::exchanges. Empty when the profiles
    //! are not computed or the scenario is infeasible.
    std::vector<net_flux> net_production;
    std::vector<net_flux> net_uptake;

    //! Record an infeasible solve: the objective and profiles are cleared.
    void set_infeasible() noexcept;
};

struct sample_result {
    std::string sample;

    //! Completion marker: set once every requested scenario of the sample
    //! is processed and the results stored.
    bool completed = false;

    std::array<scenario_result, scenario_count> scenarios;

    scenario_result& operator[](scenario s) noexcept
    {
        return scenarios[ordinal(s)];
    }

    const scenario_result& operator[](scenario s) const noexcept
    {
        return scenarios[ordinal(s)];
    }
};

struct infeasible_entry {
    std::string sample;
    scenario    which;
};

/**
 * The persisted state of a batch. @c samples has the order of the batch
 * samples. @c last_completed is the index of the last completed sample or
 * -1.
 */
struct checkpoint_state {
    std::vector<std::string>   exchanges;
    std::vector<sample_result> samples;
    int                        last_completed = -1;

    //! Samples and scenarios recorded infeasible (@c inFesMat).
    std::vector<infeasible_entry> infeasible() const;

    sample_result*       find(std::string_view sample) noexcept;
    const sample_result* find(std::string_view sample) const noexcept;
};

/**
 * @return true if the reloaded @a result can be trusted: the completion
 * marker is set, the requested scenarios are attempted and, if profiles are
 * requested, each feasible scenario has a non empty profile table. With @c
 * validate_flux_magnitude, a feasible standard scenario with an objective
 * above @c lower_biomass_bound must also have an aggregate diet flux
 * magnitude greater than 0.1.
 */
bool is_valid(const sample_result& result, const batch_parameters& params);

/**
 * Write @a state as JSON: @c exchanges, @c last-completed, @c samples (the
 * complete results with the @c netProduction and @c netUptake profiles), and
 * the summary tables @c presol (objective per sample and scenario, @c null
 * when absent) and @c inFesMat.
 */
status write_checkpoint(const checkpoint_state& state, std::FILE* fp);

result<checkpoint_state> parse_checkpoint(std::string_view buffer);

/**
 * Owner of the checkpoint files of a result directory: the intermediate
 * snapshot @c intRes.json written after every sample and the final snapshot
 * @c simRes.json written at the end of the batch. Both are written with the
 * write-then-rename protocol.
 */
class checkpoint_store
{
public:
    explicit checkpoint_store(std::filesystem::path result_dir) noexcept;

    const std::filesystem::path& intermediate_path() const noexcept
    {
        return m_intermediate;
    }

    const std::filesystem::path& final_path() const noexcept
    {
        return m_final;
    }

    status save_intermediate(const checkpoint_state& state);
    status save_final(const checkpoint_state& state);

    //! @return an empty optional if the file does not exist.
    result<std::optional<checkpoint_state>> load_intermediate() const;
    result<std::optional<checkpoint_state>> load_final() const;

private:
    std::filesystem::path m_intermediate;
    std::filesystem::path m_final;
};

} // namespace mcm

#endif
