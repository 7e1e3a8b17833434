// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_MERGE_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_MERGE_HPP

#include <microcosm/global.hpp>
#include <microcosm/model.hpp>

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcm {

enum class merge_mode : u8 {
    //! Metabolites with the same identifier are unified into one row.
    glue,

    //! Block diagonal merge. Only connector metabolites (@c [u], @c [d], @c
    //! [fe] and @c [b]) are unified, any other identical metabolite is a
    //! @c merge_errc::metabolite_collision.
    disjoint,
};

/**
 * Merge @a b into @a acc. Bounds, objective coefficients and roles of the
 * reactions of @a b are carried unchanged. Reaction identifiers must not
 * collide. On error, @a acc is left unchanged.
 *
 * If @a merge_genes is false the gene table of @a acc is dropped.
 */
status merge_into(model&            acc,
                  const model&      b,
                  const merge_mode  mode,
                  const bool        merge_genes = false);

//! Build a new model from @a a and @a b. See @c merge_into.
result<model> merge(const model&     a,
                    const model&     b,
                    const merge_mode mode,
                    const bool       merge_genes = false);

//! A node of the merge tree: a model and the number of organism models
//! merged into it.
struct merge_node {
    model m;
    int   leaves = 1;
};

//! Result of a level of the balanced merge tree. @c leftover holds the
//! last node of a level with an odd number of nodes.
struct merge_level {
    std::vector<merge_node>   merged;
    std::optional<merge_node> leftover;
};

class task_pool;

/**
 * Merge the nodes of a level pairwise (0 with 1, 2 with 3, ...). If @a pool
 * is not null, the pairs are merged concurrently. The level is strictly
 * finished when the function returns.
 */
result<merge_level> merge_pairs(std::vector<merge_node>&& level,
                                const merge_mode          mode,
                                const bool                merge_genes,
                                task_pool*                pool = nullptr);

//! Load an organism model by name.
using model_loader = std::function<result<model>(std::string_view)>;

/**
 * Merge the organism models through a left fold. Only the accumulator and
 * the current organism model are in memory.
 */
result<model> merge_sequential(std::span<const std::string> organisms,
                               const model_loader&          load,
                               const bool                   merge_genes,
                               journal_handler*             jn = nullptr);

/**
 * Merge the organism models through a balanced binary tree. The leftover of
 * each level is queued and folded into the root in level order. A final
 * model that does not account for every organism is a
 * @c merge_errc::leftover_lost error.
 */
result<model> merge_balanced(std::span<const std::string> organisms,
                             const model_loader&          load,
                             const bool                   merge_genes,
                             const int                    workers,
                             journal_handler*             jn = nullptr);

//! @return true if the sequential strategy is used for @a count organisms.
bool use_sequential_strategy(const assembly_parameters& params,
                             const sz                   count) noexcept;

//! Select the strategy from @a params and merge the organism models.
result<model> merge_organisms(const assembly_parameters& params,
                              const model_loader&        load,
                              journal_handler*           jn = nullptr);

} // namespace mcm

#endif
