// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/assembly.hpp>
#include <microcosm/file.hpp>
#include <microcosm/format.hpp>

#include "text.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace mcm {

std::optional<sz> abundance_table::find_sample(
  std::string_view id) const noexcept
{
    const auto it = std::find(samples.begin(), samples.end(), id);

    return it == samples.end()
             ? std::nullopt
             : std::optional<sz>(static_cast<sz>(it - samples.begin()));
}

status read_abundance_buffer(abundance_table& table, std::string_view buffer)
{
    table.organisms.clear();
    table.samples.clear();
    table.values.clear();

    int  line_number = 0;
    bool header      = true;

    while (not buffer.empty()) {
        auto line = trim(next_line(buffer));
        ++line_number;

        if (line.empty() or line.front() == '#')
            continue;

        auto on_line = on_error(e_line{ line_number });

        if (header) {
            next_token(line, ','); // organism column label
            while (not line.empty())
                table.samples.emplace_back(next_token(line, ','));

            if (table.samples.empty())
                return new_error(io_errc::table_format_error);

            header = false;
            continue;
        }

        table.organisms.emplace_back(next_token(line, ','));

        for (sz i = 0; i < table.samples.size(); ++i) {
            const auto value = to_real(next_token(line, ','));
            if (not value.has_value() or *value < 0.0)
                return new_error(io_errc::table_format_error);

            table.values.emplace_back(*value);
        }

        if (not line.empty())
            return new_error(io_errc::table_format_error);
    }

    if (header or table.organisms.empty())
        return new_error(io_errc::table_format_error);

    return success();
}

result<abundance_table> read_abundance_file(const std::filesystem::path& path)
{
    auto on_file = on_error(e_file_name{ path.string() });

    mcm_auto(buffer, read_file_to_buffer(path));

    abundance_table table;
    mcm_check(read_abundance_buffer(table, buffer));

    return table;
}

/* Organism owning the reaction @a id: the longest organism name followed by
 * an underscore that prefixes @a id. */
static std::optional<bool> is_present(
  const std::unordered_map<std::string_view, bool>& organisms,
  std::string_view                                  id) noexcept
{
    std::optional<bool> ret;

    for (auto pos = id.find('_'); pos != std::string_view::npos;
         pos      = id.find('_', pos + 1u)) {
        if (auto it = organisms.find(id.substr(0, pos)); it != organisms.end())
            ret = it->second;
    }

    return ret;
}

result<model> personalize_community(const model&                 setup,
                                    std::span<const std::string> organisms,
                                    std::span<const real>        abundances)
{
    if (organisms.size() != abundances.size())
        return new_error(model_errc::dimension_mismatch);

    const auto total =
      std::accumulate(abundances.begin(), abundances.end(), 0.0);

    if (not(total > 0.0))
        return new_error(assembly_errc::empty_abundance);

    std::unordered_map<std::string_view, bool> present;
    for (sz i = 0; i < organisms.size(); ++i)
        present[organisms[i]] = abundances[i] > 0.0;

    model ret = setup;
    ret.remove_reactions([&](const i32 j) {
        const auto found = is_present(present, ret.reaction(j));
        return found.has_value() and *found == false;
    });

    mcm_auto(lumen, ret.add_metabolite("microbeBiomass[u]"));

    column      col;
    std::string biomass;

    for (sz i = 0; i < organisms.size(); ++i) {
        if (not(abundances[i] > 0.0))
            continue;

        format(biomass, "{}_biomass[c]", organisms[i]);
        const auto row = ret.find_metabolite(biomass);
        if (not row.has_value())
            return new_error(assembly_errc::missing_organism_biomass,
                             e_metabolite{ biomass });

        col.emplace_back(coefficient{ *row, -abundances[i] / total });
    }

    col.emplace_back(coefficient{ lumen, 1.0 });

    mcm_check(ret.add_reaction(
      "communityBiomass", std::move(col), 0.0, default_flux_bound));

    mcm_check(
      ret.add_reaction("UFEt_microbeBiomass",
                       { { "microbeBiomass[u]", -1.0 },
                         { "microbeBiomass[fe]", 1.0 } },
                       0.0,
                       default_flux_bound));

    mcm_auto(objective,
             ret.add_reaction("EX_microbeBiomass[fe]",
                              { { "microbeBiomass[fe]", -1.0 } },
                              -default_flux_bound,
                              default_flux_bound));

    ret.change_objective(objective);

    return ret;
}

} // namespace mcm
