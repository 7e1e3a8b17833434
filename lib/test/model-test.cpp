// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/merge.hpp>
#include <microcosm/model.hpp>

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

static mcm::model make_organism(std::string_view prefix)
{
    using boost::ut::expect;

    mcm::model m(std::string{ prefix });
    const auto a = fmt::format("{}_a[c]", prefix);
    const auto b = fmt::format("{}_b[c]", prefix);

    expect(m.add_reaction(fmt::format("{}_IEX_glc[u]tr", prefix),
                          { { "glc[u]", -1.0 }, { a, 1.0 } },
                          -1000.0,
                          1000.0)
             .has_value());
    expect(m.add_reaction(fmt::format("{}_R1", prefix),
                          { { a, -1.0 }, { b, 2.0 } },
                          0.0,
                          1000.0)
             .has_value());
    expect(m.add_reaction(
                fmt::format("{}_biomass", prefix), { { b, -1.0 } }, 0.0, 1000.0, 1.0)
             .has_value());

    return m;
}

int main()
{
    using namespace boost::ut;

    "classify-reaction"_test = [] {
        using mcm::reaction_role;

        expect(mcm::classify_reaction("communityBiomass") ==
               reaction_role::community_biomass);
        expect(mcm::classify_reaction("EX_glc_D[d]") ==
               reaction_role::diet_exchange);
        expect(mcm::classify_reaction("Diet_EX_glc_D[d]") ==
               reaction_role::diet_exchange);
        expect(mcm::classify_reaction("EX_glc_D[fe]") ==
               reaction_role::fecal_exchange);
        expect(mcm::classify_reaction("EX_glc_D(e)") == reaction_role::exchange);
        expect(mcm::classify_reaction("DUt_glc_D") ==
               reaction_role::diet_transport);
        expect(mcm::classify_reaction("UFEt_glc_D") ==
               reaction_role::fecal_transport);
        expect(mcm::classify_reaction("Bacteroides_biomass525") ==
               reaction_role::biomass);
        expect(mcm::classify_reaction("EX_microbeBiomass[fe]") ==
               reaction_role::fecal_exchange);
        expect(mcm::classify_reaction("UFEt_microbeBiomass") ==
               reaction_role::fecal_transport);
        expect(mcm::classify_reaction("Bacteroides_IEX_glc_D[u]tr") ==
               reaction_role::lumen_exchange);
        expect(mcm::classify_reaction("Bacteroides_DM_atp_c_") ==
               reaction_role::demand);
        expect(mcm::classify_reaction("Bacteroides_sink_PGPm1[c]") ==
               reaction_role::sink);
        expect(mcm::classify_reaction("Host_EX_o2[e]b") ==
               reaction_role::host_blood_exchange);
        expect(mcm::classify_reaction("Host_IEX_glc_D[u]tr") ==
               reaction_role::host_lumen_exchange);
        expect(mcm::classify_reaction("Bacteroides_PGK") ==
               reaction_role::internal);
    };

    "compartments"_test = [] {
        expect(mcm::compartment_of("glc_D[e]") ==
               mcm::compartment::extracellular);
        expect(mcm::compartment_of("glc_D[fe]") == mcm::compartment::fecal);
        expect(mcm::compartment_of("glc_D") == mcm::compartment::other);
        expect(mcm::base_name("glc_D[fe]") == "glc_D");
        expect(mcm::base_name("glc_D") == "glc_D");
        expect(mcm::is_connector(mcm::compartment::lumen));
        expect(not mcm::is_connector(mcm::compartment::extracellular));
        expect(mcm::replace_all("EX_a[e]_b[e]", "[e]", "[b]") ==
               "EX_a[b]_b[b]");
    };

    "model-add"_test = [] {
        mcm::model m("toy");

        auto a = m.add_metabolite("a[c]");
        expect(a.has_value() >> fatal);
        expect(eq(*a, 0));

        expect(fails_with(mcm::model_errc::duplicated_metabolite,
                          [&]() { return m.add_metabolite("a[c]"); }));

        auto r = m.add_reaction(
          "R1", { { "a[c]", -1.0 }, { "b[c]", 1.0 }, { "a[c]", -1.0 } }, 0, 10);
        expect(r.has_value() >> fatal);
        expect(eq(m.metabolite_count(), 2));
        expect(eq(m.coefficient_of(0, *r), -2.0));
        expect(eq(m.coefficient_of(1, *r), 1.0));
        expect(eq(m.non_zero_count(), 2u));

        expect(fails_with(mcm::model_errc::duplicated_reaction, [&]() {
            return m.add_reaction("R1", { { "a[c]", -1.0 } }, 0, 10);
        }));

        expect(fails_with(mcm::model_errc::unknown_metabolite, [&]() {
            return m.add_reaction(
              "R2", mcm::column{ mcm::coefficient{ 5, 1.0 } }, 0, 10);
        }));

        expect(m.validate().has_value());
    };

    "model-rename"_test = [] {
        mcm::model m;
        auto       r = m.add_reaction("EX_glc[d]", { { "glc[d]", -1.0 } }, -1, 1);
        expect(r.has_value() >> fatal);
        expect(m.role(*r) == mcm::reaction_role::diet_exchange);

        expect(m.rename_reaction(*r, "UFEt_glc").has_value());
        expect(m.role(*r) == mcm::reaction_role::fecal_transport);
        expect(m.find_reaction("UFEt_glc").has_value());
        expect(not m.find_reaction("EX_glc[d]").has_value());

        expect(m.rename_metabolite(0, "glc[u]").has_value());
        expect(m.find_metabolite("glc[u]").has_value());
    };

    "model-remove-reactions"_test = [] {
        auto m  = make_organism("A");
        m.genes = mcm::gene_table{ { "g1", "g2" }, { "g1", "g2", "" } };

        m.remove_reactions([&](auto j) { return m.reaction(j) == "A_R1"; });

        expect(eq(m.reaction_count(), 2));
        expect(eq(m.genes->rules.size(), 2u));
        expect(m.genes->rules[0] == "g1");
        expect(m.genes->rules[1] == "");
        expect(eq(m.find_reaction("A_biomass").value_or(-1), 1));

        // A_a[c] and A_b[c] are still used by A_IEX_glc and A_biomass.
        expect(eq(m.metabolite_count(), 3));
        expect(m.validate().has_value());

        m.remove_reactions([&](auto j) { return m.reaction(j) == "A_biomass"; });
        expect(eq(m.metabolite_count(), 2));
        expect(not m.find_metabolite("A_b[c]").has_value());
        expect(m.validate().has_value());
    };

    "model-prefix"_test = [] {
        mcm::model m;
        expect(
          m.add_reaction("EX_o2(e)", { { "o2[e]", -1.0 } }, -10, 10).has_value());
        m.prefix_identifiers("Host_");

        expect(m.reaction(0) == "Host_EX_o2(e)");
        expect(m.metabolite(0) == "Host_o2[e]");
        expect(m.role(0) == mcm::reaction_role::host_blood_exchange);
        expect(m.find_metabolite("Host_o2[e]").has_value());
    };

    "model-validate-gene-table"_test = [] {
        auto m  = make_organism("A");
        m.genes = mcm::gene_table{ { "g1" }, { "g1" } };

        expect(fails_with(mcm::model_errc::gene_table_mismatch,
                          [&]() { return m.validate(); }));
    };

    "merge-disjoint-union"_test = [] {
        const auto a = make_organism("A");
        const auto b = make_organism("B");

        auto m = mcm::merge(a, b, mcm::merge_mode::disjoint);
        expect(m.has_value() >> fatal);

        // The lumen metabolite glc[u] is shared by both organisms.
        expect(eq(m->metabolite_count(), 5));
        expect(eq(m->reaction_count(), 6));
        expect(eq(m->non_zero_count(), a.non_zero_count() + b.non_zero_count()));

        const auto glc = m->find_metabolite("glc[u]");
        const auto iex = m->find_reaction("B_IEX_glc[u]tr");
        expect((glc.has_value() and iex.has_value()) >> fatal);
        expect(eq(m->coefficient_of(*glc, *iex), -1.0));
        expect(eq(m->objective(*m->find_reaction("B_biomass")), 1.0));
    };

    "merge-fold-amortized-growth"_test = [] {
        auto acc = make_organism("O0");

        int  growths   = 0;
        auto reactions = acc.reaction_capacity();

        for (int i = 1; i < 64; ++i) {
            const auto b = make_organism(fmt::format("O{}", i));
            expect(
              mcm::merge_into(acc, b, mcm::merge_mode::disjoint).has_value() >>
              fatal);

            if (acc.reaction_capacity() != reactions) {
                reactions = acc.reaction_capacity();
                ++growths;
            }
        }

        expect(eq(acc.reaction_count(), 64 * 3));
        expect(acc.metabolite_capacity() >=
               static_cast<mcm::sz>(acc.metabolite_count()));
        expect(growths <= 10) << "reallocations:" << growths;
    };

    "merge-disjoint-collision"_test = [] {
        auto       acc = make_organism("A");
        const auto b   = make_organism("A");

        expect(fails_with(mcm::merge_errc::reaction_collision, [&]() {
            return mcm::merge_into(acc, b, mcm::merge_mode::disjoint);
        }));
        expect(eq(acc.reaction_count(), 3));

        mcm::model c;
        expect(c.add_reaction("C_R1", { { "A_a[c]", -1.0 } }, 0, 1).has_value());

        expect(fails_with(mcm::merge_errc::metabolite_collision, [&]() {
            return mcm::merge_into(acc, c, mcm::merge_mode::disjoint);
        }));
        expect(eq(acc.reaction_count(), 3));
        expect(eq(acc.metabolite_count(), 3));
    };

    "merge-glue-unifies-once"_test = [] {
        auto acc = make_organism("A");

        mcm::model c;
        expect(c.add_reaction(
          "C_R1", { { "A_a[c]", -1.0 }, { "A_b[c]", 1.0 } }, 0, 1).has_value());

        expect(mcm::merge_into(acc, c, mcm::merge_mode::glue).has_value());
        expect(eq(acc.metabolite_count(), 3));
        expect(eq(acc.reaction_count(), 4));

        const auto r = acc.find_reaction("C_R1");
        expect(r.has_value() >> fatal);
        expect(eq(acc.coefficient_of(*acc.find_metabolite("A_a[c]"), *r), -1.0));
        expect(acc.validate().has_value());
    };

    "merge-genes"_test = [] {
        auto a  = make_organism("A");
        a.genes = mcm::gene_table{ { "g1", "g2" }, { "g1", "", "g2" } };

        auto b  = make_organism("B");
        b.genes = mcm::gene_table{ { "g2", "g3" }, { "g3", "g2", "" } };

        auto without = mcm::merge(a, b, mcm::merge_mode::disjoint, false);
        expect(without.has_value() >> fatal);
        expect(not without->genes.has_value());

        auto with = mcm::merge(a, b, mcm::merge_mode::disjoint, true);
        expect(with.has_value() >> fatal);
        expect(with->genes.has_value() >> fatal);
        expect(eq(with->genes->genes.size(), 3u));
        expect(eq(with->genes->rules.size(), 6u));
        expect(with->genes->rules[3] == "g3");
        expect(with->validate().has_value());
    };
}
