// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/file.hpp>
#include <microcosm/format.hpp>
#include <microcosm/io.hpp>

#include "text.hpp"

#include <system_error>
#include <utility>

namespace mcm {

static constexpr std::string_view constrained_directories[] = {
    "Rich",
    "Diet",
    "Personalized",
};

static constexpr std::string_view constrained_prefixes[] = {
    "microbiota_model_",
    "microbiota_model_diet_",
    "microbiota_model_pDiet_",
};

json_model_store::json_model_store(std::filesystem::path model_dir,
                                   std::filesystem::path result_dir) noexcept
  : m_model_dir(std::move(model_dir))
  , m_result_dir(std::move(result_dir))
{}

std::filesystem::path json_model_store::organism_path(
  std::string_view name) const
{
    return m_model_dir / fmt::format("{}.json", name);
}

std::filesystem::path json_model_store::sample_path(std::string_view sample,
                                                    bool with_host) const
{
    return m_result_dir / fmt::format("{}microbiota_model_samp_{}.json",
                                      with_host ? "host_" : "",
                                      sample);
}

std::filesystem::path json_model_store::constrained_path(
  scenario         s,
  std::string_view sample) const
{
    return m_result_dir / constrained_directories[ordinal(s)] /
           fmt::format("{}{}.json", constrained_prefixes[ordinal(s)], sample);
}

result<model> json_model_store::load_organism(std::string_view name)
{
    const auto path = organism_path(name);

    std::error_code ec;
    if (not std::filesystem::exists(path, ec))
        return new_error(assembly_errc::unknown_organism,
                         e_file_name{ path.string() });

    return read_model(path);
}

result<model> json_model_store::load_sample(std::string_view sample,
                                            bool             with_host)
{
    auto on_sample = on_error(e_sample{ sample });

    return read_model(sample_path(sample, with_host));
}

status json_model_store::save_sample(std::string_view sample,
                                     bool             with_host,
                                     const model&     m)
{
    auto on_sample = on_error(e_sample{ sample });

    return save_model(m, sample_path(sample, with_host));
}

status json_model_store::save_constrained(scenario         s,
                                          std::string_view sample,
                                          const model&     m)
{
    const auto path = constrained_path(s, sample);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
        return new_error(io_errc::directory_error,
                         e_errno{ ec.value() },
                         e_file_name{ path.parent_path().string() });

    return save_model(m, path);
}

std::string normalize_diet_reaction(std::string_view id)
{
    if (id.starts_with("Diet_EX_"))
        id.remove_prefix(8u);
    else if (id.starts_with("EX_"))
        id.remove_prefix(3u);

    if (id.ends_with("(e)") or id.ends_with("[e]") or id.ends_with("[d]"))
        id.remove_suffix(3u);

    return fmt::format("Diet_EX_{}[d]", id);
}

/* Split a diet line on the first tab or, without tab, on the first run of
 * spaces. */
static std::pair<std::string_view, std::string_view> split_diet_line(
  std::string_view line) noexcept
{
    auto pos = line.find('\t');
    if (pos == std::string_view::npos)
        pos = line.find(' ');

    if (pos == std::string_view::npos)
        return { trim(line), std::string_view{} };

    return { trim(line.substr(0, pos)), trim(line.substr(pos + 1u)) };
}

status read_diet_buffer(diet_table& diet, std::string_view buffer)
{
    diet.reactions.clear();
    diet.values.clear();

    int  line_number = 0;
    bool first       = true;

    while (not buffer.empty()) {
        const auto line = trim(next_line(buffer));
        ++line_number;

        if (line.empty() or line.front() == '#')
            continue;

        auto on_line = on_error(e_line{ line_number });

        const auto [id, rate] = split_diet_line(line);
        const auto value      = to_real(rate);
        const bool header     = std::exchange(first, false);

        if (not value.has_value()) {
            if (header)
                continue;

            return new_error(io_errc::table_format_error);
        }

        diet.reactions.emplace_back(normalize_diet_reaction(id));
        diet.values.emplace_back(-*value);
    }

    return success();
}

result<diet_table> read_diet_file(const std::filesystem::path& path)
{
    auto on_file = on_error(e_file_name{ path.string() });

    mcm_auto(buffer, read_file_to_buffer(path));

    diet_table diet;
    mcm_check(read_diet_buffer(diet, buffer));

    return diet;
}

} // namespace mcm
