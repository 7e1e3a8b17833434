// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_MODEL_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_MODEL_HPP

#include <microcosm/error.hpp>

#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcm {

//! Default flux bound of exchange and transport reactions.
inline constexpr real default_flux_bound = 1000.0;

//! Compartment of a metabolite, read from the identifier suffix (for example
//! @c glc_D[u]).
enum class compartment : u8 {
    cytosol,       //!< @c [c]
    extracellular, //!< @c [e]
    lumen,         //!< @c [u]
    diet,          //!< @c [d]
    fecal,         //!< @c [fe]
    body_fluid,    //!< @c [b]
    other,         //!< any other or missing suffix.
};

/**
 * Typed category of a reaction. The role is computed from the identifier
 * when the reaction is added or renamed (see @c classify_reaction) and is
 * never recomputed by the constraint policy.
 */
enum class reaction_role : u8 {
    internal,
    exchange,            //!< @c EX_ outside the diet and fecal compartments.
    demand,              //!< @c DM_ or @c <organism>_DM_.
    sink,                //!< @c sink_ or @c <organism>_sink_.
    biomass,             //!< any identifier containing @c biomass.
    community_biomass,   //!< @c communityBiomass.
    diet_exchange,       //!< @c EX_<m>[d] or @c Diet_EX_<m>[d].
    fecal_exchange,      //!< @c EX_<m>[fe].
    diet_transport,      //!< @c DUt_<m>.
    fecal_transport,     //!< @c UFEt_<m>.
    lumen_exchange,      //!< @c <organism>_IEX_<m>tr.
    host_blood_exchange, //!< @c Host_EX_<m>b.
    host_lumen_exchange, //!< @c Host_IEX_<m>[u]tr.
};

static inline constexpr const std::string_view reaction_role_names[] = {
    "internal",       "exchange",        "demand",
    "sink",           "biomass",         "community-biomass",
    "diet-exchange",  "fecal-exchange",  "diet-transport",
    "fecal-transport", "lumen-exchange", "host-blood-exchange",
    "host-lumen-exchange",
};

reaction_role classify_reaction(std::string_view id) noexcept;

compartment compartment_of(std::string_view metabolite) noexcept;

//! @return the identifier without the compartment suffix: @c glc_D[e] gives
//! @c glc_D.
std::string_view base_name(std::string_view metabolite) noexcept;

//! Compartments shared between models and unified by the merge function
//! even in disjoint mode.
constexpr bool is_connector(const compartment c) noexcept
{
    return c == compartment::lumen or c == compartment::diet or
           c == compartment::fecal or c == compartment::body_fluid;
}

//! Replace every occurrence of @a from with @a to in @a str.
std::string replace_all(std::string_view str,
                        std::string_view from,
                        std::string_view to);

//! One non-zero entry of a column of the stoichiometric matrix.
struct coefficient {
    i32  row;
    real value;
};

using column = std::vector<coefficient>;

//! A term of a reaction equation used to build reaction with metabolite
//! identifiers.
struct reaction_term {
    std::string_view metabolite;
    real             value;
};

//! Gene side table. @c rules stores a rule per reaction (possibly empty).
struct gene_table {
    std::vector<std::string> genes;
    std::vector<std::string> rules;
};

/**
 * A stoichiometric network. Metabolites and reactions are ordered lists of
 * unique identifiers, reactions store bounds, objective coefficient, role
 * and a sparse column of the stoichiometric matrix.
 */
class model
{
public:
    model() noexcept = default;
    explicit model(std::string name_) noexcept;

    model(const model&)            = default;
    model(model&&) noexcept        = default;
    model& operator=(const model&) = default;
    model& operator=(model&&) noexcept = default;

    std::string name;

    //! Optional gene associations. Dropped by the merge function unless
    //! genes merging is requested.
    std::optional<gene_table> genes;

    /**
     * Make room for at least @a metabolites and @a reactions. The storage
     * grows at least twice its capacity, so repeated calls with growing
     * sizes stay amortized linear.
     */
    void reserve(sz metabolites, sz reactions);
    void clear() noexcept;

    sz metabolite_capacity() const noexcept { return m_metabolites.capacity(); }
    sz reaction_capacity() const noexcept { return m_reactions.capacity(); }

    i32 metabolite_count() const noexcept;
    i32 reaction_count() const noexcept;

    result<i32>        add_metabolite(std::string_view id);
    i32                find_or_add_metabolite(std::string_view id);
    std::optional<i32> find_metabolite(std::string_view id) const noexcept;
    result<void>       rename_metabolite(i32 index, std::string_view id);

    /**
     * Add a reaction. Metabolites are referenced by index and must exist;
     * duplicated rows in @a col are summed.
     */
    result<i32> add_reaction(std::string_view id,
                             column           col,
                             real             lower,
                             real             upper,
                             real             objective = 0.0);

    /**
     * Add a reaction with an equation written with metabolite identifiers.
     * Unknown metabolites are appended to the model.
     */
    result<i32> add_reaction(std::string_view               id,
                             std::span<const reaction_term> equation,
                             real                           lower,
                             real                           upper,
                             real                           objective = 0.0);

    result<i32> add_reaction(std::string_view                     id,
                             std::initializer_list<reaction_term> equation,
                             real                                 lower,
                             real                                 upper,
                             real objective = 0.0);

    std::optional<i32> find_reaction(std::string_view id) const noexcept;
    result<void>       rename_reaction(i32 index, std::string_view id);

    /**
     * Remove every reaction where @a pred returns true. If @a
     * remove_unused_metabolites is true, metabolites no longer used by any
     * reaction are removed too.
     */
    template<typename Predicate>
    void remove_reactions(Predicate&& pred,
                          bool        remove_unused_metabolites = true);

    //! Prepend @a prefix to every metabolite and reaction identifiers.
    void prefix_identifiers(std::string_view prefix);

    const std::string& metabolite(i32 index) const noexcept;
    const std::string& reaction(i32 index) const noexcept;

    real          lower_bound(i32 index) const noexcept;
    real          upper_bound(i32 index) const noexcept;
    real          objective(i32 index) const noexcept;
    reaction_role role(i32 index) const noexcept;
    const column& stoichiometry(i32 index) const noexcept;

    void set_lower_bound(i32 index, real value) noexcept;
    void set_upper_bound(i32 index, real value) noexcept;
    void set_bounds(i32 index, real lower, real upper) noexcept;
    void set_objective(i32 index, real value) noexcept;
    void set_role(i32 index, reaction_role r) noexcept;

    //! Reset the objective vector and put a coefficient 1 on @a index.
    void change_objective(i32 index) noexcept;

    //! Coefficient of the metabolite @a met in the reaction @a rxn or zero.
    real coefficient_of(i32 met, i32 rxn) const noexcept;

    //! Number of non-zero coefficients of the stoichiometric matrix.
    sz non_zero_count() const noexcept;

    const std::vector<std::string>& metabolites() const noexcept
    {
        return m_metabolites;
    }

    const std::vector<std::string>& reactions() const noexcept
    {
        return m_reactions;
    }

    /**
     * Check the structural invariants: sizes of the reaction arrays and the
     * gene table, row indices in range, no duplicated identifier.
     */
    status validate() const;

private:
    void do_remove_reactions(const std::vector<bool>& to_remove,
                             bool                     remove_unused_metabolites);

    std::vector<std::string>             m_metabolites;
    std::unordered_map<std::string, i32> m_metabolite_index;

    std::vector<std::string>             m_reactions;
    std::unordered_map<std::string, i32> m_reaction_index;
    std::vector<real>                    m_lower;
    std::vector<real>                    m_upper;
    std::vector<real>                    m_objective;
    std::vector<reaction_role>           m_roles;
    std::vector<column>                  m_columns;
};

template<typename Predicate>
void model::remove_reactions(Predicate&& pred, bool remove_unused_metabolites)
{
    std::vector<bool> to_remove(m_reactions.size(), false);
    bool              found = false;

    for (i32 i = 0, e = reaction_count(); i != e; ++i) {
        if (pred(i)) {
            to_remove[static_cast<sz>(i)] = true;
            found                         = true;
        }
    }

    if (found)
        do_remove_reactions(to_remove, remove_unused_metabolites);
}

inline const std::string& model::metabolite(i32 index) const noexcept
{
    debug::ensure(0 <= index and index < metabolite_count());
    return m_metabolites[static_cast<sz>(index)];
}

inline const std::string& model::reaction(i32 index) const noexcept
{
    debug::ensure(0 <= index and index < reaction_count());
    return m_reactions[static_cast<sz>(index)];
}

inline real model::lower_bound(i32 index) const noexcept
{
    return m_lower[static_cast<sz>(index)];
}

inline real model::upper_bound(i32 index) const noexcept
{
    return m_upper[static_cast<sz>(index)];
}

inline real model::objective(i32 index) const noexcept
{
    return m_objective[static_cast<sz>(index)];
}

inline reaction_role model::role(i32 index) const noexcept
{
    return m_roles[static_cast<sz>(index)];
}

inline const column& model::stoichiometry(i32 index) const noexcept
{
    return m_columns[static_cast<sz>(index)];
}

inline void model::set_lower_bound(i32 index, real value) noexcept
{
    m_lower[static_cast<sz>(index)] = value;
}

inline void model::set_upper_bound(i32 index, real value) noexcept
{
    m_upper[static_cast<sz>(index)] = value;
}

inline void model::set_bounds(i32 index, real lower, real upper) noexcept
{
    m_lower[static_cast<sz>(index)] = lower;
    m_upper[static_cast<sz>(index)] = upper;
}

inline void model::set_objective(i32 index, real value) noexcept
{
    m_objective[static_cast<sz>(index)] = value;
}

inline void model::set_role(i32 index, reaction_role r) noexcept
{
    m_roles[static_cast<sz>(index)] = r;
}

} // namespace mcm

#endif
