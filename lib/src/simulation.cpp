// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/constraint.hpp>
#include <microcosm/format.hpp>
#include <microcosm/simulation.hpp>

#include <algorithm>
#include <system_error>

namespace mcm {

static sz exchange_index(std::vector<std::string>& exchanges,
                         std::string_view          id)
{
    const auto it = std::find(exchanges.begin(), exchanges.end(), id);
    if (it != exchanges.end())
        return static_cast<sz>(it - exchanges.begin());

    exchanges.emplace_back(id);
    return exchanges.size() - 1u;
}

static status do_solve_scenario(const model&              m,
                                lp_solver&                solver,
                                flux_variability*         fva,
                                std::vector<std::string>& exchanges,
                                scenario_result&          out)
{
    out           = scenario_result{};
    out.attempted = true;

    mcm_auto(solution, solver.solve(build_lp_problem(m)));

    if (not solution.feasible()) {
        out.set_infeasible();
        return success();
    }

    out.feasible  = true;
    out.objective = solution.objective;

    if (not fva)
        return success();

    const auto fecal = fecal_exchanges(m);
    const auto diet  = paired_diet_exchanges(m, fecal);

    std::vector<i32> reactions(fecal);
    for (const auto j : diet)
        if (j >= 0)
            reactions.emplace_back(j);

    mcm_auto(ranges, fva->analyse(m, reactions));
    if (ranges.size() != reactions.size())
        return new_error(model_errc::dimension_mismatch);

    std::vector<sz> index(fecal.size());
    for (sz k = 0; k < fecal.size(); ++k)
        index[k] = exchange_index(exchanges, m.reaction(fecal[k]));

    out.net_production.resize(exchanges.size());
    out.net_uptake.resize(exchanges.size());

    auto next_diet = fecal.size();
    for (sz k = 0; k < fecal.size(); ++k) {
        auto& production = out.net_production[index[k]];
        auto& uptake     = out.net_uptake[index[k]];

        production.fecal = ranges[k].max;
        uptake.fecal     = ranges[k].min;

        if (diet[k] >= 0) {
            production.diet = ranges[next_diet].min;
            uptake.diet     = ranges[next_diet].max;
            ++next_diet;
        }
    }

    return success();
}

status solve_scenario(const model&              m,
                      lp_solver&                solver,
                      flux_variability*         fva,
                      std::vector<std::string>& exchanges,
                      scenario_result&          out)
{
    return attempt(
      [&]() -> status {
          return do_solve_scenario(m, solver, fva, exchanges, out);
      },
      [&](match<simulation_errc,
                simulation_errc::solver_failure,
                simulation_errc::flux_variability_failure>) -> status {
          out.set_infeasible();
          return success();
      });
}

namespace {

class batch_runner
{
public:
    batch_runner(const batch_parameters&         params,
                 model_store&                    store,
                 lp_solver&                      solver,
                 flux_variability&               fva,
                 const diet_table&               diet,
                 journal_handler&                jn,
                 const personalized_diet_source& personalized,
                 const sample_observer&          observer) noexcept
      : m_params(params)
      , m_store(store)
      , m_solver(solver)
      , m_fva(fva)
      , m_diet(diet)
      , m_jn(jn)
      , m_personalized(personalized)
      , m_observer(observer)
      , m_checkpoint(params.result_dir)
    {}

    result<checkpoint_state> run();

private:
    result<std::optional<checkpoint_state>> try_final_snapshot();
    result<std::optional<checkpoint_state>> load_previous();
    status                                  simulate(sample_result& out);
    status solve(scenario s, const model& m, sample_result& out);
    void   pad_profiles() noexcept;

    const batch_parameters&         m_params;
    model_store&                    m_store;
    lp_solver&                      m_solver;
    flux_variability&               m_fva;
    const diet_table&               m_diet;
    journal_handler&                m_jn;
    const personalized_diet_source& m_personalized;
    const sample_observer&          m_observer;
    checkpoint_store                m_checkpoint;
    checkpoint_state                m_state;
};

/* An unreadable checkpoint is not trusted: the samples are recomputed. */
template<typename Loader>
result<std::optional<checkpoint_state>> recover(journal_handler& jn,
                                                const Loader&    load)
{
    using return_type = result<std::optional<checkpoint_state>>;

    return attempt(
      [&]() -> return_type { return load(); },
      [&](const checkpoint_errc, const e_file_name& file) -> return_type {
          jn.push(log_level::warning, [&](auto& title, auto& msg) {
              format(title, "Checkpoint ignored");
              format(msg, "`{}' has a bad format", file.sv());
          });
          return std::optional<checkpoint_state>{};
      },
      [&](match<io_errc, io_errc::json_format_error>,
          const e_file_name& file) -> return_type {
          jn.push(log_level::warning, [&](auto& title, auto& msg) {
              format(title, "Checkpoint ignored");
              format(msg, "`{}' is not a JSON file", file.sv());
          });
          return std::optional<checkpoint_state>{};
      });
}

result<std::optional<checkpoint_state>> batch_runner::try_final_snapshot()
{
    mcm_auto(final_state,
             recover(m_jn, [&]() { return m_checkpoint.load_final(); }));

    if (not final_state.has_value())
        return std::optional<checkpoint_state>{};

    checkpoint_state ret;
    ret.exchanges = final_state->exchanges;

    for (const auto& id : m_params.samples) {
        const auto* found = final_state->find(id);
        if (not found or not is_valid(*found, m_params))
            return std::optional<checkpoint_state>{};

        ret.samples.emplace_back(*found);
    }

    ret.last_completed = static_cast<int>(ret.samples.size()) - 1;

    return std::optional<checkpoint_state>(std::move(ret));
}

result<std::optional<checkpoint_state>> batch_runner::load_previous()
{
    mcm_auto(previous,
             recover(m_jn, [&]() { return m_checkpoint.load_intermediate(); }));

    if (previous.has_value())
        return std::move(previous);

    return recover(m_jn, [&]() { return m_checkpoint.load_final(); });
}

void batch_runner::pad_profiles() noexcept
{
    const auto size = m_state.exchanges.size();

    for (auto& s : m_state.samples) {
        for (auto& r : s.scenarios) {
            if (not r.net_production.empty())
                r.net_production.resize(size);
            if (not r.net_uptake.empty())
                r.net_uptake.resize(size);
        }
    }
}

status batch_runner::solve(scenario s, const model& m, sample_result& out)
{
    const bool profiles = m_params.compute_profiles and
                          (s != scenario::rich or m_params.rich_diet);

    mcm_check(solve_scenario(
      m, m_solver, profiles ? &m_fva : nullptr, m_state.exchanges, out[s]));

    if (not out[s].feasible) {
        m_jn.push(log_level::warning, [&](auto& title, auto& msg) {
            format(title, "Sample {}", out.sample);
            format(msg, "{} scenario is infeasible", scenario_names[ordinal(s)]);
        });
    }

    const bool save = m_params.save_constrained_models and
                      (s != scenario::rich or m_params.rich_diet);

    if (save)
        mcm_check(m_store.save_constrained(s, out.sample, m));

    return success();
}

status batch_runner::simulate(sample_result& out)
{
    auto on_sample = on_error(e_sample{ out.sample });

    mcm_auto(community,
             m_store.load_sample(out.sample, m_params.host.has_value()));
    mcm_auto(rich, apply_base_constraints(community, m_params));

    mcm_check(solve(scenario::rich, rich, out));

    if (not out[scenario::rich].feasible) {
        out[scenario::standard].set_infeasible();
        if (m_params.personalized_diet)
            out[scenario::personalized].set_infeasible();

        m_jn.push(log_level::warning, [&](auto& title, auto& msg) {
            format(title, "Sample {}", out.sample);
            format(msg, "presolve is infeasible, diet scenarios skipped");
        });

        return success();
    }

    {
        model standard = rich;
        const auto missing =
          apply_diet(standard, m_diet, m_params.include_human_metabolites);

        if (missing > 0) {
            m_jn.push(log_level::info, [&](auto& title, auto& msg) {
                format(title, "Sample {}", out.sample);
                format(msg, "{} diet reactions not in the model", missing);
            });
        }

        mcm_check(solve(scenario::standard, standard, out));
    }

    if (m_params.personalized_diet) {
        mcm_auto(diet, m_personalized(out.sample));

        model personalized = rich;
        apply_diet(personalized, diet, m_params.include_human_metabolites);

        mcm_check(solve(scenario::personalized, personalized, out));
    }

    return success();
}

result<checkpoint_state> batch_runner::run()
{
    if (m_params.samples.empty())
        return new_error(simulation_errc::empty_sample_list);

    if (m_params.personalized_diet and not m_personalized)
        return new_error(simulation_errc::personalized_diet_missing);

    if (not m_params.result_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(m_params.result_dir, ec);

        if (ec)
            return new_error(io_errc::directory_error,
                             e_file_name{ m_params.result_dir.string() },
                             e_errno{ ec.value() });
    }

    if (not m_params.force_repeat) {
        mcm_auto(final_state, try_final_snapshot());

        if (final_state.has_value()) {
            m_jn.push(log_level::notice, [&](auto& title, auto& msg) {
                format(title, "Simulation skipped");
                format(msg,
                       "`{}' holds the results of the {} samples",
                       m_checkpoint.final_path().string(),
                       final_state->samples.size());
            });

            return std::move(*final_state);
        }
    }

    std::optional<checkpoint_state> previous;
    if (not m_params.force_repeat) {
        mcm_auto(loaded, load_previous());
        previous = std::move(loaded);
    }

    if (previous.has_value())
        m_state.exchanges = previous->exchanges;

    int reused = 0;
    m_state.samples.reserve(m_params.samples.size());

    for (const auto& id : m_params.samples) {
        const auto* found = previous ? previous->find(id) : nullptr;

        if (found and is_valid(*found, m_params)) {
            m_state.samples.emplace_back(*found);
            m_state.last_completed =
              static_cast<int>(m_state.samples.size()) - 1;
            ++reused;
        } else {
            auto& s  = m_state.samples.emplace_back();
            s.sample = id;
        }
    }

    if (reused > 0) {
        m_jn.push(log_level::notice, [&](auto& title, auto& msg) {
            format(title, "Simulation resumed");
            format(msg,
                   "{} of {} samples reloaded from checkpoint",
                   reused,
                   m_state.samples.size());
        });
    }

    pad_profiles();

    for (sz i = 0; i < m_state.samples.size(); ++i) {
        auto& s = m_state.samples[i];
        if (s.completed)
            continue;

        const auto start = journal_handler::get_tick_count_in_milliseconds();

        s = sample_result{};
        s.sample = m_params.samples[i];

        mcm_check(simulate(s));

        s.completed            = true;
        m_state.last_completed = static_cast<int>(i);
        pad_profiles();

        mcm_check(m_checkpoint.save_intermediate(m_state));

        m_jn.push(log_level::info, [&](auto& title, auto& msg) {
            format(title, "Sample {} done", s.sample);
            format(msg,
                   "{}/{} in {}ms",
                   i + 1u,
                   m_state.samples.size(),
                   journal_handler::get_elapsed_time(start));
        });

        if (m_observer)
            m_observer(s);
    }

    mcm_check(m_checkpoint.save_final(m_state));

    if (const auto infeasible = m_state.infeasible(); not infeasible.empty()) {
        m_jn.push(log_level::warning, [&](auto& title, auto& msg) {
            format(title, "Simulation done");
            format(msg,
                   "{} infeasible scenarios, see `{}'",
                   infeasible.size(),
                   m_checkpoint.final_path().string());
        });
    } else {
        m_jn.push(log_level::notice, [&](auto& title, auto& msg) {
            format(title, "Simulation done");
            format(msg, "{} samples", m_state.samples.size());
        });
    }

    return std::move(m_state);
}

} // namespace

result<checkpoint_state> run_batch(const batch_parameters&         params,
                                   model_store&                    store,
                                   lp_solver&                      solver,
                                   flux_variability&               fva,
                                   const diet_table&               diet,
                                   journal_handler&                jn,
                                   const personalized_diet_source& personalized,
                                   const sample_observer&          observer)
{
    batch_runner runner(
      params, store, solver, fva, diet, jn, personalized, observer);

    return runner.run();
}

} // namespace mcm
