// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/model.hpp>

#include <algorithm>
#include <unordered_set>

namespace mcm {

static constexpr bool contains(std::string_view str,
                               std::string_view pattern) noexcept
{
    return str.find(pattern) != std::string_view::npos;
}

reaction_role classify_reaction(std::string_view id) noexcept
{
    if (id == "communityBiomass")
        return reaction_role::community_biomass;

    if (id.starts_with("Host_EX_"))
        return reaction_role::host_blood_exchange;

    if (id.starts_with("Host_IEX_"))
        return reaction_role::host_lumen_exchange;

    if (id.starts_with("Diet_EX_"))
        return reaction_role::diet_exchange;

    if (id.starts_with("DUt_"))
        return reaction_role::diet_transport;

    if (id.starts_with("UFEt_"))
        return reaction_role::fecal_transport;

    if (id.starts_with("EX_")) {
        if (contains(id, "[d]"))
            return reaction_role::diet_exchange;
        if (contains(id, "[fe]"))
            return reaction_role::fecal_exchange;
        return reaction_role::exchange;
    }

    if (contains(id, "biomass"))
        return reaction_role::biomass;

    if (contains(id, "_IEX_"))
        return reaction_role::lumen_exchange;

    if (id.starts_with("DM_") or contains(id, "_DM_"))
        return reaction_role::demand;

    if (id.starts_with("sink_") or contains(id, "_sink_"))
        return reaction_role::sink;

    return reaction_role::internal;
}

namespace {

using namespace std::string_view_literals;

static_assert(contains("EX_glc_D[fe]"sv, "[fe]"sv));
static_assert(not contains("EX_glc_D[e]"sv, "[fe]"sv));

}

compartment compartment_of(std::string_view metabolite) noexcept
{
    if (metabolite.ends_with("[c]"))
        return compartment::cytosol;
    if (metabolite.ends_with("[e]"))
        return compartment::extracellular;
    if (metabolite.ends_with("[u]"))
        return compartment::lumen;
    if (metabolite.ends_with("[d]"))
        return compartment::diet;
    if (metabolite.ends_with("[fe]"))
        return compartment::fecal;
    if (metabolite.ends_with("[b]"))
        return compartment::body_fluid;

    return compartment::other;
}

std::string_view base_name(std::string_view metabolite) noexcept
{
    if (not metabolite.ends_with(']'))
        return metabolite;

    const auto open = metabolite.rfind('[');
    return open == std::string_view::npos ? metabolite
                                          : metabolite.substr(0, open);
}

std::string replace_all(std::string_view str,
                        std::string_view from,
                        std::string_view to)
{
    std::string ret;
    ret.reserve(str.size());

    if (from.empty()) {
        ret = str;
        return ret;
    }

    for (auto pos = str.find(from); pos != std::string_view::npos;
         pos      = str.find(from)) {
        ret.append(str.substr(0, pos));
        ret.append(to);
        str = str.substr(pos + from.size());
    }

    ret.append(str);
    return ret;
}

static void sort_and_sum(column& col)
{
    std::sort(col.begin(), col.end(), [](const auto& a, const auto& b) {
        return a.row < b.row;
    });

    auto out = col.begin();
    for (auto it = col.begin(); it != col.end();) {
        auto value = it->value;
        auto row   = it->row;

        for (++it; it != col.end() and it->row == row; ++it)
            value += it->value;

        if (value != 0.0)
            *out++ = coefficient{ row, value };
    }

    col.erase(out, col.end());
}

model::model(std::string name_) noexcept
  : name(std::move(name_))
{}

void model::reserve(sz metabolites, sz reactions)
{
    if (metabolites > m_metabolites.capacity()) {
        const auto n = std::max(metabolites, 2u * m_metabolites.capacity());

        m_metabolites.reserve(n);
        m_metabolite_index.reserve(n);
    }

    if (reactions > m_reactions.capacity()) {
        const auto n = std::max(reactions, 2u * m_reactions.capacity());

        m_reactions.reserve(n);
        m_reaction_index.reserve(n);
        m_lower.reserve(n);
        m_upper.reserve(n);
        m_objective.reserve(n);
        m_roles.reserve(n);
        m_columns.reserve(n);
    }
}

void model::clear() noexcept
{
    name.clear();
    genes.reset();

    m_metabolites.clear();
    m_metabolite_index.clear();
    m_reactions.clear();
    m_reaction_index.clear();
    m_lower.clear();
    m_upper.clear();
    m_objective.clear();
    m_roles.clear();
    m_columns.clear();
}

i32 model::metabolite_count() const noexcept
{
    return static_cast<i32>(m_metabolites.size());
}

i32 model::reaction_count() const noexcept
{
    return static_cast<i32>(m_reactions.size());
}

result<i32> model::add_metabolite(std::string_view id)
{
    const auto index = metabolite_count();
    const auto [it, inserted] =
      m_metabolite_index.try_emplace(std::string(id), index);

    if (not inserted)
        return new_error(model_errc::duplicated_metabolite, e_metabolite{ id });

    m_metabolites.emplace_back(id);
    return index;
}

i32 model::find_or_add_metabolite(std::string_view id)
{
    const auto index = metabolite_count();
    const auto [it, inserted] =
      m_metabolite_index.try_emplace(std::string(id), index);

    if (inserted)
        m_metabolites.emplace_back(id);

    return it->second;
}

std::optional<i32> model::find_metabolite(std::string_view id) const noexcept
{
    if (auto it = m_metabolite_index.find(std::string(id));
        it != m_metabolite_index.end())
        return it->second;

    return std::nullopt;
}

result<void> model::rename_metabolite(i32 index, std::string_view id)
{
    debug::ensure(0 <= index and index < metabolite_count());

    auto& old = m_metabolites[static_cast<sz>(index)];
    if (old == id)
        return success();

    if (m_metabolite_index.contains(std::string(id)))
        return new_error(model_errc::duplicated_metabolite, e_metabolite{ id });

    m_metabolite_index.erase(old);
    old = id;
    m_metabolite_index.emplace(old, index);

    return success();
}

result<i32> model::add_reaction(std::string_view id,
                                column           col,
                                real             lower,
                                real             upper,
                                real             objective)
{
    for (const auto& c : col)
        if (c.row < 0 or c.row >= metabolite_count())
            return new_error(model_errc::unknown_metabolite, e_reaction{ id });

    const auto index = reaction_count();
    const auto [it, inserted] =
      m_reaction_index.try_emplace(std::string(id), index);

    if (not inserted)
        return new_error(model_errc::duplicated_reaction, e_reaction{ id });

    sort_and_sum(col);

    m_reactions.emplace_back(id);
    m_lower.emplace_back(lower);
    m_upper.emplace_back(upper);
    m_objective.emplace_back(objective);
    m_roles.emplace_back(classify_reaction(id));
    m_columns.emplace_back(std::move(col));

    if (genes.has_value())
        genes->rules.emplace_back();

    return index;
}

result<i32> model::add_reaction(std::string_view               id,
                                std::span<const reaction_term> equation,
                                real                           lower,
                                real                           upper,
                                real                           objective)
{
    if (m_reaction_index.contains(std::string(id)))
        return new_error(model_errc::duplicated_reaction, e_reaction{ id });

    column col;
    col.reserve(equation.size());

    for (const auto& term : equation)
        col.emplace_back(
          coefficient{ find_or_add_metabolite(term.metabolite), term.value });

    return add_reaction(id, std::move(col), lower, upper, objective);
}

result<i32> model::add_reaction(std::string_view                     id,
                                std::initializer_list<reaction_term> equation,
                                real                                 lower,
                                real                                 upper,
                                real                                 objective)
{
    return add_reaction(id,
                        std::span<const reaction_term>(equation.begin(),
                                                       equation.size()),
                        lower,
                        upper,
                        objective);
}

std::optional<i32> model::find_reaction(std::string_view id) const noexcept
{
    if (auto it = m_reaction_index.find(std::string(id));
        it != m_reaction_index.end())
        return it->second;

    return std::nullopt;
}

result<void> model::rename_reaction(i32 index, std::string_view id)
{
    debug::ensure(0 <= index and index < reaction_count());

    auto& old = m_reactions[static_cast<sz>(index)];
    if (old == id)
        return success();

    if (m_reaction_index.contains(std::string(id)))
        return new_error(model_errc::duplicated_reaction, e_reaction{ id });

    m_reaction_index.erase(old);
    old = id;
    m_reaction_index.emplace(old, index);
    m_roles[static_cast<sz>(index)] = classify_reaction(old);

    return success();
}

void model::prefix_identifiers(std::string_view prefix)
{
    m_metabolite_index.clear();
    for (sz i = 0; i < m_metabolites.size(); ++i) {
        m_metabolites[i].insert(0, prefix);
        m_metabolite_index.emplace(m_metabolites[i], static_cast<i32>(i));
    }

    m_reaction_index.clear();
    for (sz i = 0; i < m_reactions.size(); ++i) {
        m_reactions[i].insert(0, prefix);
        m_reaction_index.emplace(m_reactions[i], static_cast<i32>(i));
        m_roles[i] = classify_reaction(m_reactions[i]);
    }
}

void model::change_objective(i32 index) noexcept
{
    std::fill(m_objective.begin(), m_objective.end(), 0.0);
    m_objective[static_cast<sz>(index)] = 1.0;
}

real model::coefficient_of(i32 met, i32 rxn) const noexcept
{
    const auto& col = stoichiometry(rxn);
    const auto  it  = std::lower_bound(
      col.begin(), col.end(), met, [](const auto& c, const i32 row) {
          return c.row < row;
      });

    return it != col.end() and it->row == met ? it->value : 0.0;
}

sz model::non_zero_count() const noexcept
{
    sz ret = 0;
    for (const auto& col : m_columns)
        ret += col.size();

    return ret;
}

void model::do_remove_reactions(const std::vector<bool>& to_remove,
                                bool remove_unused_metabolites)
{
    sz out = 0;
    for (sz i = 0, e = m_reactions.size(); i != e; ++i) {
        if (to_remove[i])
            continue;

        if (out != i) {
            m_reactions[out] = std::move(m_reactions[i]);
            m_lower[out]     = m_lower[i];
            m_upper[out]     = m_upper[i];
            m_objective[out] = m_objective[i];
            m_roles[out]     = m_roles[i];
            m_columns[out]   = std::move(m_columns[i]);

            if (genes.has_value() and i < genes->rules.size())
                genes->rules[out] = std::move(genes->rules[i]);
        }

        ++out;
    }

    m_reactions.resize(out);
    m_lower.resize(out);
    m_upper.resize(out);
    m_objective.resize(out);
    m_roles.resize(out);
    m_columns.resize(out);

    if (genes.has_value() and genes->rules.size() > out)
        genes->rules.resize(out);

    m_reaction_index.clear();
    for (sz i = 0; i < m_reactions.size(); ++i)
        m_reaction_index.emplace(m_reactions[i], static_cast<i32>(i));

    if (not remove_unused_metabolites)
        return;

    std::vector<i32> used(m_metabolites.size(), -1);
    for (const auto& col : m_columns)
        for (const auto& c : col)
            used[static_cast<sz>(c.row)] = 0;

    i32 next = 0;
    for (sz i = 0; i < used.size(); ++i) {
        if (used[i] == 0) {
            used[i] = next;
            if (static_cast<sz>(next) != i)
                m_metabolites[static_cast<sz>(next)] =
                  std::move(m_metabolites[i]);
            ++next;
        }
    }

    m_metabolites.resize(static_cast<sz>(next));

    for (auto& col : m_columns)
        for (auto& c : col)
            c.row = used[static_cast<sz>(c.row)];

    m_metabolite_index.clear();
    for (sz i = 0; i < m_metabolites.size(); ++i)
        m_metabolite_index.emplace(m_metabolites[i], static_cast<i32>(i));
}

status model::validate() const
{
    const auto n = m_reactions.size();

    if (m_lower.size() != n or m_upper.size() != n or
        m_objective.size() != n or m_roles.size() != n or
        m_columns.size() != n or m_reaction_index.size() != n)
        return new_error(model_errc::dimension_mismatch);

    if (m_metabolite_index.size() != m_metabolites.size())
        return new_error(model_errc::duplicated_metabolite);

    if (genes.has_value() and genes->rules.size() != n)
        return new_error(model_errc::gene_table_mismatch);

    for (sz i = 0; i < n; ++i) {
        for (const auto& c : m_columns[i]) {
            if (c.row < 0 or c.row >= metabolite_count())
                return new_error(model_errc::unknown_metabolite,
                                 e_reaction{ m_reactions[i] });
        }
    }

    return success();
}

} // namespace mcm
