// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_IO_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_IO_HPP

#include <microcosm/global.hpp>
#include <microcosm/model.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <cstdio>

namespace mcm {

/**
 * Read a model from the JSON buffer @a buffer. The JSON object has the
 * members:
 *
 * - @c name (optional),
 * - @c metabolites: array of identifiers,
 * - @c reactions: array of objects @c { "id", "lb", "ub", "c" },
 * - @c S: array of @c [row, column, value] triplets,
 * - @c genes and @c rules (optional): array of gene identifiers and one
 *   rule string per reaction.
 */
result<model> parse_model(std::string_view buffer);

result<model> read_model(const std::filesystem::path& path);

//! Write @a m with the JSON format of @c parse_model.
status write_model(const model& m, std::FILE* fp);

//! Write @a m into @a path with the write-then-rename protocol.
status save_model(const model& m, const std::filesystem::path& path);

//! Interface to the stored models: organism models, per sample community
//! models and constrained models.
class model_store
{
public:
    virtual ~model_store() noexcept = default;

    virtual result<model> load_organism(std::string_view name) = 0;

    //! Load the community model of @a sample, the host coupled variant if
    //! @a with_host is true.
    virtual result<model> load_sample(std::string_view sample,
                                      bool             with_host) = 0;

    virtual status save_sample(std::string_view sample,
                               bool             with_host,
                               const model&     m) = 0;

    virtual status save_constrained(scenario         s,
                                    std::string_view sample,
                                    const model&     m) = 0;
};

/**
 * Directory based @c model_store. Organism models are read from @c
 * <model_dir>/<organism>.json, community models are stored in @a
 * result_dir as @c microbiota_model_samp_<id>.json (@c host_ prefix for the
 * host coupled variant) and constrained models in the @c Rich, @c Diet and
 * @c Personalized sub directories.
 */
class json_model_store final : public model_store
{
public:
    json_model_store(std::filesystem::path model_dir,
                     std::filesystem::path result_dir) noexcept;

    result<model> load_organism(std::string_view name) override;
    result<model> load_sample(std::string_view sample,
                              bool             with_host) override;
    status        save_sample(std::string_view sample,
                              bool             with_host,
                              const model&     m) override;
    status        save_constrained(scenario         s,
                                   std::string_view sample,
                                   const model&     m) override;

    std::filesystem::path organism_path(std::string_view name) const;
    std::filesystem::path sample_path(std::string_view sample,
                                      bool             with_host) const;
    std::filesystem::path constrained_path(scenario         s,
                                           std::string_view sample) const;

private:
    std::filesystem::path m_model_dir;
    std::filesystem::path m_result_dir;
};

/**
 * Diet definition: diet exchange reactions (normalized to @c
 * Diet_EX_<m>[d]) and lower bounds stored as negative uptake fluxes.
 */
struct diet_table {
    std::vector<std::string> reactions;
    std::vector<real>        values;

    sz size() const noexcept { return reactions.size(); }
};

//! Normalize a diet identifier: @c EX_m(e), @c EX_m[e], @c EX_m[d], @c m
//! and @c Diet_EX_m[d] give @c Diet_EX_m[d].
std::string normalize_diet_reaction(std::string_view id);

/**
 * Read a tab or whitespace separated two columns table (exchange
 * identifier, uptake rate). A first line without a numeric second column is
 * a header. File values are positive uptake rates and are stored negated.
 */
status read_diet_buffer(diet_table& diet, std::string_view buffer);

result<diet_table> read_diet_file(const std::filesystem::path& path);

//! Per sample diet of the personalized scenario.
using personalized_diet_source =
  std::function<result<diet_table>(std::string_view sample)>;

} // namespace mcm

#endif
