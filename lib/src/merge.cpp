// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/format.hpp>
#include <microcosm/merge.hpp>
#include <microcosm/thread.hpp>

#include <unordered_set>

namespace mcm {

static status check_collisions(const model&     acc,
                               const model&     b,
                               const merge_mode mode)
{
    for (const auto& id : b.reactions())
        if (acc.find_reaction(id).has_value())
            return new_error(merge_errc::reaction_collision, e_reaction{ id });

    if (mode == merge_mode::disjoint) {
        for (const auto& id : b.metabolites())
            if (not is_connector(compartment_of(id)) and
                acc.find_metabolite(id).has_value())
                return new_error(merge_errc::metabolite_collision,
                                 e_metabolite{ id });
    }

    return success();
}

static void merge_gene_list(gene_table& acc, const gene_table& b)
{
    std::unordered_set<std::string_view> known(acc.genes.begin(),
                                               acc.genes.end());

    std::vector<std::string> to_add;
    for (const auto& g : b.genes)
        if (not known.contains(g))
            to_add.emplace_back(g);

    for (auto& g : to_add)
        acc.genes.emplace_back(std::move(g));
}

status merge_into(model&           acc,
                  const model&     b,
                  const merge_mode mode,
                  const bool       merge_genes)
{
    mcm_check(check_collisions(acc, b, mode));

    if (not merge_genes) {
        acc.genes.reset();
    } else if (b.genes.has_value() and not acc.genes.has_value()) {
        acc.genes.emplace();
        acc.genes->rules.resize(static_cast<sz>(acc.reaction_count()));
    }

    acc.reserve(static_cast<sz>(acc.metabolite_count() + b.metabolite_count()),
                static_cast<sz>(acc.reaction_count() + b.reaction_count()));

    std::vector<i32> rows(static_cast<sz>(b.metabolite_count()));
    for (i32 i = 0, e = b.metabolite_count(); i != e; ++i)
        rows[static_cast<sz>(i)] = acc.find_or_add_metabolite(b.metabolite(i));

    const bool copy_rules = merge_genes and b.genes.has_value();

    for (i32 j = 0, e = b.reaction_count(); j != e; ++j) {
        const auto& src = b.stoichiometry(j);

        column col;
        col.reserve(src.size());
        for (const auto& c : src)
            col.emplace_back(
              coefficient{ rows[static_cast<sz>(c.row)], c.value });

        mcm_auto(id,
                 acc.add_reaction(b.reaction(j),
                                  std::move(col),
                                  b.lower_bound(j),
                                  b.upper_bound(j),
                                  b.objective(j)));

        acc.set_role(id, b.role(j));

        if (copy_rules and static_cast<sz>(j) < b.genes->rules.size())
            acc.genes->rules[static_cast<sz>(id)] =
              b.genes->rules[static_cast<sz>(j)];
    }

    if (copy_rules)
        merge_gene_list(*acc.genes, *b.genes);

    return success();
}

result<model> merge(const model&     a,
                    const model&     b,
                    const merge_mode mode,
                    const bool       merge_genes)
{
    model ret = a;
    mcm_check(merge_into(ret, b, mode, merge_genes));

    return ret;
}

namespace {

struct merge_slot {
    merge_node* first  = nullptr;
    merge_node* second = nullptr;

    bool        done  = false;
    merge_errc  error = merge_errc::worker_failure;
    std::string identifier;
};

void run_slot(merge_slot& slot, const merge_mode mode, const bool merge_genes)
{
    attempt_all(
      [&]() -> status {
          mcm_check(
            merge_into(slot.first->m, slot.second->m, mode, merge_genes));
          slot.first->leaves += slot.second->leaves;
          slot.done = true;
          return success();
      },
      [&](const merge_errc ec, const e_reaction& id) {
          slot.error = ec;
          slot.identifier.assign(id.sv());
      },
      [&](const merge_errc ec, const e_metabolite& id) {
          slot.error = ec;
          slot.identifier.assign(id.sv());
      },
      [&](const merge_errc ec) { slot.error = ec; },
      [&]() { slot.error = merge_errc::worker_failure; });
}

status report_slot(const merge_slot& slot)
{
    switch (slot.error) {
    case merge_errc::reaction_collision:
        return new_error(slot.error, e_reaction{ slot.identifier });
    case merge_errc::metabolite_collision:
        return new_error(slot.error, e_metabolite{ slot.identifier });
    default:
        return new_error(slot.error);
    }
}

} // namespace

result<merge_level> merge_pairs(std::vector<merge_node>&& level,
                                const merge_mode          mode,
                                const bool                merge_genes,
                                task_pool*                pool)
{
    merge_level ret;

    const auto pairs = level.size() / 2u;
    if (level.size() % 2u == 1u)
        ret.leftover = std::move(level.back());

    std::vector<merge_slot> slots(pairs);
    for (sz i = 0; i < pairs; ++i) {
        slots[i].first  = &level[2u * i];
        slots[i].second = &level[2u * i + 1u];
    }

    if (pool and pairs > 1u) {
        for (auto& slot : slots)
            pool->list().add(
              [&slot, mode, merge_genes] { run_slot(slot, mode, merge_genes); });

        pool->run();
    } else {
        for (auto& slot : slots)
            run_slot(slot, mode, merge_genes);
    }

    ret.merged.reserve(pairs);
    for (auto& slot : slots) {
        if (not slot.done)
            return report_slot(slot);

        ret.merged.emplace_back(std::move(*slot.first));
    }

    return ret;
}

result<model> merge_sequential(std::span<const std::string> organisms,
                               const model_loader&          load,
                               const bool                   merge_genes,
                               journal_handler*             jn)
{
    if (organisms.empty())
        return new_error(merge_errc::empty_organism_list);

    model acc;
    {
        auto on_organism = on_error(e_file_name{ organisms.front() });
        mcm_auto(first, load(organisms.front()));
        acc = std::move(first);
    }

    for (sz i = 1; i < organisms.size(); ++i) {
        auto on_organism = on_error(e_file_name{ organisms[i] });

        mcm_auto(next, load(organisms[i]));
        mcm_check(merge_into(acc, next, merge_mode::disjoint, merge_genes));
    }

    if (jn)
        jn->push(log_level::info, [&](auto& title, auto& msg) {
            format(title, "Sequential merge");
            format(msg,
                   "{} organisms, {} metabolites, {} reactions",
                   organisms.size(),
                   acc.metabolite_count(),
                   acc.reaction_count());
        });

    return acc;
}

result<model> merge_balanced(std::span<const std::string> organisms,
                             const model_loader&          load,
                             const bool                   merge_genes,
                             const int                    workers,
                             journal_handler*             jn)
{
    if (organisms.empty())
        return new_error(merge_errc::empty_organism_list);

    std::vector<merge_node> level;
    level.reserve(organisms.size());

    for (const auto& name : organisms) {
        auto on_organism = on_error(e_file_name{ name });

        mcm_auto(m, load(name));
        level.emplace_back(merge_node{ std::move(m), 1 });
    }

    std::optional<task_pool> pool;
    if (workers > 1)
        pool.emplace(static_cast<unsigned>(workers));

    std::vector<merge_node> leftovers;
    int                     depth = 0;

    while (level.size() > 1u) {
        mcm_auto(next,
                 merge_pairs(std::move(level),
                             merge_mode::disjoint,
                             merge_genes,
                             pool.has_value() ? &*pool : nullptr));

        ++depth;
        if (jn)
            jn->push(log_level::debug, [&](auto& title, auto& msg) {
                format(title, "Merge level {}", depth);
                format(msg,
                       "{} nodes{}",
                       next.merged.size(),
                       next.leftover.has_value() ? " and one leftover" : "");
            });

        if (next.leftover.has_value())
            leftovers.emplace_back(std::move(*next.leftover));

        level = std::move(next.merged);
    }

    auto root = std::move(level.front());
    for (auto& leftover : leftovers) {
        debug_log("merge leftover of {} organisms\n", leftover.leaves);
        mcm_check(
          merge_into(root.m, leftover.m, merge_mode::disjoint, merge_genes));
        root.leaves += leftover.leaves;
    }

    if (root.leaves != static_cast<int>(organisms.size()))
        return new_error(merge_errc::leftover_lost);

    if (jn)
        jn->push(log_level::info, [&](auto& title, auto& msg) {
            format(title, "Balanced merge");
            format(msg,
                   "{} organisms, {} levels, {} leftovers, {} metabolites, {} "
                   "reactions",
                   organisms.size(),
                   depth,
                   leftovers.size(),
                   root.m.metabolite_count(),
                   root.m.reaction_count());
        });

    return std::move(root.m);
}

bool use_sequential_strategy(const assembly_parameters& params,
                             const sz                   count) noexcept
{
    switch (params.strategy) {
    case merge_strategy::sequential:
        return true;
    case merge_strategy::balanced:
        return false;
    case merge_strategy::automatic:
        return count > static_cast<sz>(params.sequential_threshold);
    }

    unreachable();
}

result<model> merge_organisms(const assembly_parameters& params,
                              const model_loader&        load,
                              journal_handler*           jn)
{
    const auto organisms = std::span<const std::string>(params.organisms);

    return use_sequential_strategy(params, organisms.size())
             ? merge_sequential(organisms, load, params.merge_genes, jn)
             : merge_balanced(
                 organisms, load, params.merge_genes, params.workers, jn);
}

} // namespace mcm
