// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/assembly.hpp>
#include <microcosm/checkpoint.hpp>
#include <microcosm/constraint.hpp>
#include <microcosm/io.hpp>
#include <microcosm/simulation.hpp>
#include <microcosm/solver.hpp>

#include <algorithm>
#include <filesystem>
#include <map>

#include <cmath>

#include <fmt/format.h>

#include <boost/ut.hpp>

template<typename Errc, typename Function>
static bool fails_with(const Errc expected, Function&& fn)
{
    return mcm::attempt_all(
      [&]() -> mcm::result<bool> {
          mcm_check(fn());
          return false;
      },
      [&](const Errc ec) { return ec == expected; },
      []() { return false; });
}

/* A deterministic solver for the tests: the linear program is infeasible if
 * a column has a lower bound greater than its upper bound, otherwise each
 * column takes the bound that improves the objective. Rows are ignored. */
class bound_solver final : public mcm::lp_solver
{
public:
    int calls = 0;

    mcm::result<mcm::lp_solution> solve(const mcm::lp_problem& pb) override
    {
        ++calls;

        mcm::lp_solution sol;
        for (mcm::i32 j = 0; j < pb.col_count; ++j) {
            if (pb.lower[j] > pb.upper[j]) {
                sol.status = mcm::lp_status::infeasible;
                return sol;
            }
        }

        sol.status = mcm::lp_status::optimal;
        sol.primal.resize(static_cast<std::size_t>(pb.col_count));

        for (mcm::i32 j = 0; j < pb.col_count; ++j) {
            const auto c = pb.objective[j];
            const auto v = pb.maximize == (c > 0.0) ? pb.upper[j] : pb.lower[j];

            sol.primal[j] = v;
            sol.objective += c * v;
        }

        return sol;
    }
};

/* A solver reporting a numerical failure for the problems with a column of
 * lower bound @c failed_bound or, once the flux variability row with an
 * infinite upper bound is added, for the problems with a column of lower
 * bound @c failed_variability_bound. */
class failing_solver final : public mcm::lp_solver
{
public:
    static constexpr mcm::real failed_bound             = -123.0;
    static constexpr mcm::real failed_variability_bound = -321.0;

    bound_solver solver;
    int          failures = 0;

    mcm::result<mcm::lp_solution> solve(const mcm::lp_problem& pb) override
    {
        const auto has = [&](const mcm::real bound) {
            return std::find(pb.lower.begin(), pb.lower.end(), bound) !=
                   pb.lower.end();
        };

        const bool variability =
          not pb.row_upper.empty() and std::isinf(pb.row_upper.back());

        if (has(failed_bound) or
            (variability and has(failed_variability_bound))) {
            ++failures;
            return mcm::new_error(mcm::simulation_errc::solver_failure);
        }

        return solver.solve(pb);
    }
};

/* Community models per sample kept in memory. */
class memory_store final : public mcm::model_store
{
public:
    std::map<std::string, mcm::model, std::less<>> samples;
    std::vector<std::string>                       constrained;
    int                                            loads = 0;

    mcm::result<mcm::model> load_organism(std::string_view) override
    {
        return mcm::new_error(mcm::assembly_errc::unknown_organism);
    }

    mcm::result<mcm::model> load_sample(std::string_view sample,
                                        bool /*with_host*/) override
    {
        ++loads;

        if (auto it = samples.find(sample); it != samples.end())
            return it->second;

        return mcm::new_error(mcm::io_errc::open_error,
                              mcm::e_file_name{ sample });
    }

    mcm::status save_sample(std::string_view  sample,
                            bool              /*with_host*/,
                            const mcm::model& m) override
    {
        samples.insert_or_assign(std::string{ sample }, m);
        return mcm::success();
    }

    mcm::status save_constrained(mcm::scenario     s,
                                 std::string_view  sample,
                                 const mcm::model& /*m*/) override
    {
        constrained.emplace_back(fmt::format(
          "{}:{}", mcm::scenario_names[mcm::ordinal(s)], sample));
        return mcm::success();
    }
};

static mcm::model make_organism(std::string_view name)
{
    using boost::ut::expect;

    mcm::model m(std::string{ name });
    const auto a       = fmt::format("{}_a[c]", name);
    const auto biomass = fmt::format("{}_biomass[c]", name);

    expect(m.add_reaction(fmt::format("{}_IEX_glc_D[u]tr", name),
                          { { "glc_D[u]", -1.0 }, { a, 1.0 } },
                          -1000.0,
                          1000.0)
             .has_value());
    expect(m.add_reaction(fmt::format("{}_IEX_ac[u]tr", name),
                          { { a, -1.0 }, { "ac[u]", 1.0 } },
                          -1000.0,
                          1000.0)
             .has_value());
    expect(m.add_reaction(fmt::format("{}_R1", name),
                          { { a, -1.0 }, { biomass, 1.0 } },
                          0.0,
                          1000.0)
             .has_value());
    expect(m.add_reaction(fmt::format("{}_biomass0", name),
                          { { biomass, -1.0 } },
                          -5.0,
                          1000.0)
             .has_value());
    expect(m.add_reaction(
                fmt::format("{}_DM_a[c]", name), { { a, -1.0 } }, -5.0, 1000.0)
             .has_value());
    expect(m.add_reaction(fmt::format("{}_sink_a[c]", name),
                          { { a, -1.0 } },
                          -1000.0,
                          1000.0)
             .has_value());

    return m;
}

static mcm::model make_host()
{
    using boost::ut::expect;

    mcm::model host("Recon");

    for (const auto* met : { "glc_D", "o2", "gchola" })
        expect(host.add_reaction(fmt::format("EX_{}(e)", met),
                                 { { fmt::format("{}[e]", met), -1.0 } },
                                 -10,
                                 10)
                 .has_value());

    // Transports keep the extracellular metabolites once the exchanges
    // are moved to the body fluid.
    for (const auto* met : { "glc_D", "o2", "gchola" })
        expect(host.add_reaction(fmt::format("{}t", met),
                                 { { fmt::format("{}[e]", met), -1.0 },
                                   { fmt::format("{}[c]", met), 1.0 } },
                                 -1000,
                                 1000)
                 .has_value());
    expect(host.add_reaction(
                 "biomass_reaction", { { "glc_D[c]", -1.0 } }, 0, 1000)
             .has_value());

    return host;
}

static mcm::model make_community(const mcm::model* host = nullptr)
{
    using namespace boost::ut;

    mcm::assembly_parameters params;
    params.organisms = { "A", "B" };

    const mcm::model_loader load =
      [](std::string_view name) -> mcm::result<mcm::model> {
        return make_organism(name);
    };

    const std::vector<std::string> exchanges{ "glc_D[e]",
                                              "ac[e]",
                                              "gchola[e]" };

    auto setup = mcm::assemble_community(params, load, host, exchanges);
    expect(setup.has_value() >> fatal);

    const std::vector<mcm::real> abundances{ 0.5, 0.5 };
    auto                         community =
      mcm::personalize_community(*setup, params.organisms, abundances);
    expect(community.has_value() >> fatal);

    return std::move(*community);
}

static mcm::i32 index_of(const mcm::model& m, std::string_view id)
{
    using namespace boost::ut;

    const auto j = m.find_reaction(id);
    expect(j.has_value() >> fatal) << id;

    return *j;
}

static mcm::diet_table make_diet()
{
    mcm::diet_table diet;
    diet.reactions = { "Diet_EX_glc_D[d]", "Diet_EX_fru[d]" };
    diet.values    = { -10.0, -2.0 };

    return diet;
}

static bool same_flux(const mcm::real a, const mcm::real b) noexcept
{
    return (std::isnan(a) and std::isnan(b)) or a == b;
}

static bool same_results(const mcm::checkpoint_state& a,
                         const mcm::checkpoint_state& b)
{
    if (a.exchanges != b.exchanges or a.samples.size() != b.samples.size())
        return false;

    for (std::size_t i = 0; i < a.samples.size(); ++i) {
        const auto& x = a.samples[i];
        const auto& y = b.samples[i];

        if (x.sample != y.sample or x.completed != y.completed)
            return false;

        for (int s = 0; s < mcm::scenario_count; ++s) {
            const auto& r = x.scenarios[s];
            const auto& t = y.scenarios[s];

            if (r.attempted != t.attempted or r.feasible != t.feasible or
                r.objective != t.objective or
                r.net_production.size() != t.net_production.size() or
                r.net_uptake.size() != t.net_uptake.size())
                return false;

            for (std::size_t k = 0; k < r.net_production.size(); ++k)
                if (not same_flux(r.net_production[k].diet,
                                  t.net_production[k].diet) or
                    not same_flux(r.net_production[k].fecal,
                                  t.net_production[k].fecal) or
                    not same_flux(r.net_uptake[k].diet, t.net_uptake[k].diet) or
                    not same_flux(r.net_uptake[k].fecal, t.net_uptake[k].fecal))
                    return false;
        }
    }

    return true;
}

static std::filesystem::path make_result_dir(std::string_view name)
{
    auto path = std::filesystem::temp_directory_path() /
                fmt::format("microcosm-simulation-test-{}", name);

    std::error_code ec;
    std::filesystem::remove_all(path, ec);

    return path;
}

int main()
{
    using namespace boost::ut;

    "base-constraints"_test = [] {
        const auto community = make_community();

        mcm::batch_parameters params;
        auto                  m = mcm::apply_base_constraints(community, params);
        expect(m.has_value() >> fatal);

        expect(eq(m->lower_bound(index_of(*m, "A_biomass0")), 0.0));
        expect(eq(m->lower_bound(index_of(*m, "A_DM_a[c]")), 0.0));
        expect(eq(m->lower_bound(index_of(*m, "B_sink_a[c]")), -1.0));

        const auto objective = index_of(*m, "EX_microbeBiomass[fe]");
        for (mcm::i32 j = 0, e = m->reaction_count(); j != e; ++j)
            expect(eq(m->objective(j), j == objective ? 1.0 : 0.0));

        expect(not m->find_reaction("EX_glc_D[d]").has_value());
        const auto diet = index_of(*m, "Diet_EX_glc_D[d]");
        expect(m->role(diet) == mcm::reaction_role::diet_exchange);
        expect(eq(m->upper_bound(diet), mcm::open_flux_bound));

        const auto biomass = index_of(*m, "communityBiomass");
        expect(eq(m->lower_bound(biomass), 0.4));
        expect(eq(m->upper_bound(biomass), 1.0));

        for (const auto* id : { "DUt_glc_D", "UFEt_ac", "EX_ac[fe]" })
            expect(eq(m->upper_bound(index_of(*m, id)), mcm::open_flux_bound));

        // The community model is not modified.
        expect(community.find_reaction("EX_glc_D[d]").has_value());
    };

    "base-constraints-errors"_test = [] {
        mcm::model            empty;
        mcm::batch_parameters params;

        expect(fails_with(mcm::constraint_errc::missing_community_biomass,
                          [&]() {
                              return mcm::apply_base_constraints(empty, params);
                          }));

        auto community = make_community();
        community.remove_reactions([&](auto j) {
            return community.reaction(j) == "EX_microbeBiomass[fe]";
        });

        expect(fails_with(mcm::constraint_errc::missing_objective, [&]() {
            return mcm::apply_base_constraints(community, params);
        }));
    };

    "host-constraints"_test = [] {
        const auto host      = make_host();
        const auto community = make_community(&host);

        mcm::batch_parameters params;
        params.host.emplace();
        params.host->biomass_reaction = "biomass_reaction";
        params.host->biomass_flux_cap = 2.0;

        auto m = mcm::apply_base_constraints(community, params);
        expect(m.has_value() >> fatal);

        expect(eq(m->lower_bound(index_of(*m, "Host_EX_glc_D(e)b")), 0.0));
        expect(eq(m->lower_bound(index_of(*m, "Host_EX_o2(e)b")),
                  mcm::host_uptake_bound));
        expect(eq(m->lower_bound(index_of(*m, "Host_IEX_glc_D[u]tr")), 0.0));
        expect(eq(m->lower_bound(index_of(*m, "Host_IEX_gchola[u]tr")),
                  -mcm::default_flux_bound));

        const auto biomass = index_of(*m, "Host_biomass_reaction");
        expect(eq(m->lower_bound(biomass), mcm::host_biomass_lower_bound));
        expect(eq(m->upper_bound(biomass), 2.0));

        params.host->biomass_reaction = "unknown";
        expect(fails_with(mcm::constraint_errc::missing_host_biomass, [&]() {
            return mcm::apply_base_constraints(community, params);
        }));
    };

    "apply-diet"_test = [] {
        const auto host = make_host();
        auto       m    = mcm::apply_base_constraints(make_community(&host),
                                             mcm::batch_parameters{});
        expect(m.has_value() >> fatal);

        const auto missing = mcm::apply_diet(*m, make_diet(), true);
        expect(eq(missing, 1));

        expect(eq(m->lower_bound(index_of(*m, "Diet_EX_glc_D[d]")), -10.0));
        expect(eq(m->lower_bound(index_of(*m, "Diet_EX_ac[d]")), 0.0));
        expect(eq(m->lower_bound(index_of(*m, "Diet_EX_gchola[d]")), -10.0));

        const auto fecal = mcm::fecal_exchanges(*m);
        const auto diet  = mcm::paired_diet_exchanges(*m, fecal);
        expect(eq(fecal.size(), diet.size()));

        for (std::size_t i = 0; i < fecal.size(); ++i) {
            expect(m->reaction(fecal[i]) != "EX_microbeBiomass[fe]");
            expect((diet[i] >= 0) >> fatal);

            const auto fecal_base = mcm::base_name(m->reaction(fecal[i]));
            const auto diet_base  = mcm::base_name(m->reaction(diet[i]));
            expect(fecal_base.substr(3) == diet_base.substr(8));
        }
    };

    "diet-file"_test = [] {
        expect(mcm::normalize_diet_reaction("EX_glc_D(e)") ==
               "Diet_EX_glc_D[d]");
        expect(mcm::normalize_diet_reaction("EX_glc_D[e]") ==
               "Diet_EX_glc_D[d]");
        expect(mcm::normalize_diet_reaction("glc_D") == "Diet_EX_glc_D[d]");
        expect(mcm::normalize_diet_reaction("Diet_EX_glc_D[d]") ==
               "Diet_EX_glc_D[d]");

        mcm::diet_table diet;
        expect(mcm::read_diet_buffer(diet,
                                     "Reaction\tFlux (mmol/human*day)\n"
                                     "EX_glc_D(e)\t10\n"
                                     "# comment\n"
                                     "ac 2.5\n")
                 .has_value() >>
               fatal);

        expect(eq(diet.size(), 2u) >> fatal);
        expect(diet.reactions[0] == "Diet_EX_glc_D[d]");
        expect(eq(diet.values[0], -10.0));
        expect(diet.reactions[1] == "Diet_EX_ac[d]");
        expect(eq(diet.values[1], -2.5));

        expect(fails_with(mcm::io_errc::table_format_error, [&]() {
            return mcm::read_diet_buffer(diet, "EX_glc_D(e)\t10\nEX_ac(e)\n");
        }));
    };

    "checkpoint-validation"_test = [] {
        mcm::batch_parameters params;

        mcm::sample_result r;
        r.sample = "s1";
        expect(not mcm::is_valid(r, params));

        r.completed                            = true;
        r[mcm::scenario::rich].attempted       = true;
        r[mcm::scenario::standard].attempted   = true;
        r[mcm::scenario::standard].feasible    = true;
        r[mcm::scenario::standard].objective   = 1.0;
        expect(not mcm::is_valid(r, params));

        r[mcm::scenario::standard].net_production.emplace_back(
          mcm::net_flux{ -0.05, 1.0 });
        expect(mcm::is_valid(r, params));

        params.validate_flux_magnitude = true;
        expect(not mcm::is_valid(r, params));

        r[mcm::scenario::standard].net_production.emplace_back(
          mcm::net_flux{ -1.0, 1.0 });
        expect(mcm::is_valid(r, params));

        params.personalized_diet = true;
        expect(not mcm::is_valid(r, params));

        r[mcm::scenario::personalized].set_infeasible();
        expect(mcm::is_valid(r, params));
    };

    "checkpoint-round-trip"_test = [] {
        const auto dir = make_result_dir("checkpoint");
        std::filesystem::create_directories(dir);

        mcm::checkpoint_state state;
        state.exchanges = { "EX_ac[fe]", "EX_glc_D[fe]" };
        state.samples.resize(2);
        state.samples[0].sample    = "s1";
        state.samples[0].completed = true;
        state.samples[0][mcm::scenario::standard].attempted = true;
        state.samples[0][mcm::scenario::standard].feasible  = true;
        state.samples[0][mcm::scenario::standard].objective = 12.5;
        state.samples[0][mcm::scenario::standard].net_production = {
            { -1.0, 2.0 }, {}
        };
        state.samples[0][mcm::scenario::standard].net_uptake = { { 3.0, -4.0 },
                                                                 {} };
        state.samples[0][mcm::scenario::rich].set_infeasible();
        state.samples[1].sample = "s2";
        state.last_completed    = 0;

        mcm::checkpoint_store store(dir);
        expect(store.save_intermediate(state).has_value() >> fatal);
        expect(not std::filesystem::exists(
          mcm::temporary_path(store.intermediate_path())));

        auto final_state = store.load_final();
        expect(final_state.has_value() >> fatal);
        expect(not final_state->has_value());

        auto loaded = store.load_intermediate();
        expect(loaded.has_value() >> fatal);
        expect(loaded->has_value() >> fatal);
        expect(same_results(state, **loaded));
        expect(eq((*loaded)->last_completed, 0));

        const auto infeasible = (*loaded)->infeasible();
        expect(eq(infeasible.size(), 1u) >> fatal);
        expect(infeasible[0].sample == "s1");
        expect(infeasible[0].which == mcm::scenario::rich);

        expect(fails_with(mcm::checkpoint_errc::format_error, [&]() {
            return mcm::parse_checkpoint(R"({ "exchanges": [] })");
        }));
    };

    "batch-infeasible-sample-continues"_test = [] {
        memory_store store;
        store.samples.emplace("s1", make_community());
        store.samples.emplace("s2", make_community());

        auto bad = make_community();
        bad.set_lower_bound(index_of(bad, "EX_microbeBiomass[fe]"), 2.e6);
        store.samples.emplace("bad", std::move(bad));

        mcm::batch_parameters params;
        params.result_dir = make_result_dir("infeasible");
        params.samples    = { "s1", "bad", "s2" };

        bound_solver             solver;
        mcm::lp_flux_variability fva(solver);
        mcm::journal_handler     jn;

        auto state = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(state.has_value() >> fatal);
        expect(eq(state->samples.size(), 3u) >> fatal);
        expect(eq(state->last_completed, 2));

        for (const auto& s : state->samples)
            expect(s.completed);

        const auto& s1 = state->samples[0];
        expect(s1[mcm::scenario::rich].feasible);
        expect(s1[mcm::scenario::rich].net_production.empty());
        expect(s1[mcm::scenario::standard].feasible);
        expect(not s1[mcm::scenario::personalized].attempted);

        const auto& bad_result = state->samples[1];
        expect(not bad_result[mcm::scenario::rich].feasible);
        expect(not bad_result[mcm::scenario::standard].feasible);
        expect(not bad_result[mcm::scenario::standard].objective.has_value());

        expect(state->samples[2][mcm::scenario::standard].feasible);
        expect(eq(state->infeasible().size(), 2u));
        expect(jn.count(mcm::log_level::warning) >= 2u);

        // Profiles of the standard diet: the flux ranges are the bounds.
        expect(eq(state->exchanges.size(), 3u) >> fatal);
        const auto& profile = s1[mcm::scenario::standard];
        expect(eq(profile.net_production.size(), 3u) >> fatal);

        const auto glc = std::find(state->exchanges.begin(),
                                   state->exchanges.end(),
                                   "EX_glc_D[fe]") -
                         state->exchanges.begin();
        expect(eq(profile.net_production[glc].diet, -10.0));
        expect(eq(profile.net_production[glc].fecal, mcm::open_flux_bound));
        expect(eq(profile.net_uptake[glc].diet, mcm::open_flux_bound));
        expect(eq(profile.net_uptake[glc].fecal, -mcm::default_flux_bound));

        expect(std::filesystem::exists(params.result_dir / "intRes.json"));
        expect(std::filesystem::exists(params.result_dir / "simRes.json"));
    };

    "batch-solver-failure-continues"_test = [] {
        memory_store store;
        store.samples.emplace("s1", make_community());

        auto broken = make_community();
        broken.set_lower_bound(index_of(broken, "EX_microbeBiomass[fe]"),
                               failing_solver::failed_bound);
        store.samples.emplace("broken", std::move(broken));

        auto unstable = make_community();
        unstable.set_lower_bound(index_of(unstable, "EX_microbeBiomass[fe]"),
                                 failing_solver::failed_variability_bound);
        store.samples.emplace("unstable", std::move(unstable));

        store.samples.emplace("s2", make_community());

        mcm::batch_parameters params;
        params.result_dir = make_result_dir("solver-failure");
        params.samples    = { "s1", "broken", "unstable", "s2" };

        failing_solver           solver;
        mcm::lp_flux_variability fva(solver);
        mcm::journal_handler     jn;

        auto state = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(state.has_value() >> fatal);
        expect(eq(state->samples.size(), 4u) >> fatal);
        expect(eq(state->last_completed, 3));
        expect(solver.failures >= 2);

        for (const auto& s : state->samples)
            expect(s.completed);

        const auto& broken_result = state->samples[1];
        expect(broken_result[mcm::scenario::rich].attempted);
        expect(not broken_result[mcm::scenario::rich].feasible);
        expect(not broken_result[mcm::scenario::standard].feasible);
        expect(not broken_result[mcm::scenario::standard].objective.has_value());

        // The optimum is found but the flux ranges are not: the profiles
        // are dropped with the scenario.
        const auto& unstable_result = state->samples[2];
        expect(unstable_result[mcm::scenario::rich].feasible);
        expect(unstable_result[mcm::scenario::standard].attempted);
        expect(not unstable_result[mcm::scenario::standard].feasible);
        expect(
          not unstable_result[mcm::scenario::standard].objective.has_value());

        expect(state->samples[0][mcm::scenario::standard].feasible);
        expect(state->samples[3][mcm::scenario::standard].feasible);
        expect(eq(state->infeasible().size(), 3u));
    };

    "batch-journal-drained-per-sample"_test = [] {
        constexpr int sample_count = 130;

        memory_store store;
        auto         bad = make_community();
        bad.set_lower_bound(index_of(bad, "EX_microbeBiomass[fe]"), 2.e6);

        mcm::batch_parameters params;
        params.result_dir = make_result_dir("journal");

        for (int i = 0; i < sample_count; ++i) {
            auto id = fmt::format("bad{}", i);
            store.samples.emplace(id, bad);
            params.samples.emplace_back(std::move(id));
        }

        bound_solver             solver;
        mcm::lp_flux_variability fva(solver);
        mcm::journal_handler     jn;

        int      observed = 0;
        unsigned warnings = 0;
        unsigned entries  = 0;

        const mcm::sample_observer observer =
          [&](const mcm::sample_result& r) {
              ++observed;
              expect(r.completed);

              jn.flush([&](const mcm::journal_handler::entry& e) {
                  ++entries;
                  if (e.level == mcm::log_level::warning)
                      ++warnings;
              });
          };

        auto state = mcm::run_batch(
          params, store, solver, fva, make_diet(), jn, {}, observer);
        expect(state.has_value() >> fatal);
        expect(eq(observed, sample_count));

        // Two warnings and one information per sample, more than the
        // journal capacity, and the final summary.
        expect(eq(entries, 3u * sample_count));
        expect(eq(warnings + jn.count(mcm::log_level::warning),
                  2u * sample_count + 1u));
        expect(eq(jn.size(), 1u));
    };

    "batch-resume-idempotent"_test = [] {
        memory_store store;
        for (const auto* id : { "s1", "s2", "s3" })
            store.samples.emplace(id, make_community());

        mcm::batch_parameters params;
        params.result_dir = make_result_dir("resume");
        params.samples    = { "s1", "s2", "s3" };
        params.rich_diet  = true;

        bound_solver             solver;
        mcm::lp_flux_variability fva(solver);
        mcm::journal_handler     jn;

        auto full = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(full.has_value() >> fatal);
        expect(eq(store.loads, 3));

        // Truncate the checkpoint after the first sample.
        mcm::checkpoint_store checkpoint(params.result_dir);
        {
            auto state = checkpoint.load_intermediate();
            expect((state.has_value() and state->has_value()) >> fatal);

            auto truncated = std::move(**state);
            for (std::size_t i = 1; i < truncated.samples.size(); ++i) {
                const auto id         = truncated.samples[i].sample;
                truncated.samples[i]        = mcm::sample_result{};
                truncated.samples[i].sample = id;
            }
            truncated.last_completed = 0;

            expect(checkpoint.save_intermediate(truncated).has_value() >> fatal);
            std::filesystem::remove(checkpoint.final_path());
        }

        store.loads = 0;
        auto resumed = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(resumed.has_value() >> fatal);
        expect(eq(store.loads, 2));
        expect(same_results(*full, *resumed));

        // A valid final snapshot is returned without any solve.
        store.loads  = 0;
        solver.calls = 0;
        auto again = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(again.has_value() >> fatal);
        expect(eq(store.loads, 0));
        expect(eq(solver.calls, 0));
        expect(same_results(*full, *again));

        params.force_repeat = true;
        auto forced = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(forced.has_value() >> fatal);
        expect(eq(store.loads, 3));
        expect(same_results(*full, *forced));
    };

    "batch-stale-sample-recomputed"_test = [] {
        memory_store store;
        for (const auto* id : { "s1", "s2" })
            store.samples.emplace(id, make_community());

        mcm::batch_parameters params;
        params.result_dir = make_result_dir("stale");
        params.samples    = { "s1", "s2" };

        bound_solver             solver;
        mcm::lp_flux_variability fva(solver);
        mcm::journal_handler     jn;

        auto full = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(full.has_value() >> fatal);

        // A completed sample without its standard profile is not trusted.
        mcm::checkpoint_store checkpoint(params.result_dir);
        auto                  stale = *full;
        stale.samples[1][mcm::scenario::standard].net_production.clear();
        expect(checkpoint.save_intermediate(stale).has_value() >> fatal);
        expect(checkpoint.save_final(stale).has_value() >> fatal);

        store.loads = 0;
        auto resumed = mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        expect(resumed.has_value() >> fatal);
        expect(eq(store.loads, 1));
        expect(same_results(*full, *resumed));
    };

    "batch-scenarios"_test = [] {
        memory_store store;
        store.samples.emplace("s1", make_community());

        mcm::batch_parameters params;
        params.result_dir              = make_result_dir("scenarios");
        params.samples                 = { "s1" };
        params.personalized_diet       = true;
        params.save_constrained_models = true;

        bound_solver             solver;
        mcm::lp_flux_variability fva(solver);
        mcm::journal_handler     jn;

        expect(fails_with(mcm::simulation_errc::personalized_diet_missing, [&]() {
            return mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        }));

        int                                  requests = 0;
        const mcm::personalized_diet_source source =
          [&](std::string_view) -> mcm::result<mcm::diet_table> {
            ++requests;
            mcm::diet_table diet;
            diet.reactions = { "Diet_EX_ac[d]" };
            diet.values    = { -3.0 };
            return diet;
        };

        auto state =
          mcm::run_batch(params, store, solver, fva, make_diet(), jn, source);
        expect(state.has_value() >> fatal);
        expect(eq(requests, 1));

        const auto& r = state->samples[0];
        expect(r[mcm::scenario::personalized].feasible);
        expect(not r[mcm::scenario::personalized].net_production.empty());
        expect(eq(store.constrained.size(), 2u));

        params.samples.clear();
        expect(fails_with(mcm::simulation_errc::empty_sample_list, [&]() {
            return mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        }));
    };

    "batch-structural-error-stops"_test = [] {
        memory_store store;
        store.samples.emplace("s1", make_community());

        mcm::batch_parameters params;
        params.result_dir = make_result_dir("structural");
        params.samples    = { "s1", "missing" };

        bound_solver             solver;
        mcm::lp_flux_variability fva(solver);
        mcm::journal_handler     jn;

        expect(fails_with(mcm::io_errc::open_error, [&]() {
            return mcm::run_batch(params, store, solver, fva, make_diet(), jn);
        }));

        // The first sample is kept in the intermediate checkpoint.
        mcm::checkpoint_store checkpoint(params.result_dir);
        auto                  state = checkpoint.load_intermediate();
        expect((state.has_value() and state->has_value()) >> fatal);
        expect(eq((*state)->last_completed, 0));
        expect((*state)->samples[0].completed);
        expect(not(*state)->samples[1].completed);
    };

    "configuration"_test = [] {
        mcm::configuration cfg;

        expect(mcm::parse_configuration(cfg,
                                        "# study\n"
                                        "[paths]\n"
                                        "model_dir = models\n"
                                        "result_dir = results\n"
                                        "[assembly]\n"
                                        "organisms = A, B ,C\n"
                                        "strategy = balanced\n"
                                        "workers = 4\n"
                                        "[simulation]\n"
                                        "samples = s1,s2\n"
                                        "rich_diet = true\n"
                                        "lower_biomass_bound = 0.1\n"
                                        "; host\n"
                                        "[host]\n"
                                        "biomass_reaction = biomass_reaction\n"
                                        "biomass_flux_cap = 1.5\n")
                 .has_value() >>
               fatal);

        expect(cfg.assembly.model_dir == "models");
        expect(cfg.batch.model_dir == "models");
        expect(cfg.batch.result_dir == "results");
        expect(eq(cfg.assembly.organisms.size(), 3u) >> fatal);
        expect(cfg.assembly.organisms[1] == "B");
        expect(cfg.assembly.strategy == mcm::merge_strategy::balanced);
        expect(eq(cfg.assembly.workers, 4));
        expect(eq(cfg.batch.samples.size(), 2u));
        expect(cfg.batch.rich_diet);
        expect(eq(cfg.batch.lower_biomass_bound, 0.1));
        expect(cfg.batch.host.has_value() >> fatal);
        expect(eq(cfg.batch.host->biomass_flux_cap, 1.5));

        expect(fails_with(mcm::config_errc::unknown_key, [&]() {
            return mcm::parse_configuration(cfg, "[paths]\nunknown = 1\n");
        }));
        expect(fails_with(mcm::config_errc::unknown_key, [&]() {
            return mcm::parse_configuration(cfg, "[simulation]\nworkers = 2\n");
        }));
        expect(fails_with(mcm::config_errc::unknown_section, [&]() {
            return mcm::parse_configuration(cfg, "[unknown]\n");
        }));
        expect(fails_with(mcm::config_errc::bad_boolean, [&]() {
            return mcm::parse_configuration(cfg, "[simulation]\nrich_diet=1x\n");
        }));
    };

    "model-store-unknown-organism"_test = [] {
        const auto dir = make_result_dir("store");
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        expect((not ec) >> fatal);

        mcm::json_model_store store(dir, dir);
        expect(not std::filesystem::exists(store.organism_path("Missing")));
        expect(fails_with(mcm::assembly_errc::unknown_organism,
                          [&]() { return store.load_organism("Missing"); }));
    };
}
