// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/file.hpp>
#include <microcosm/format.hpp>
#include <microcosm/global.hpp>

#include "text.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

#include <fmt/format.h>

namespace mcm {

enum class section_id : u8 { none, paths, assembly, simulation, host };

struct section_map {
    std::string_view name;
    section_id       id;
};

// Sorted by name for the binary search.
static constexpr section_map sections[] = {
    { "assembly", section_id::assembly },
    { "host", section_id::host },
    { "paths", section_id::paths },
    { "simulation", section_id::simulation },
};

namespace {

using namespace std::string_view_literals;

static_assert(trim("  totoa \t"sv) == "totoa"sv);
static_assert(trim(" \r\n"sv).empty());
static_assert(trim("a"sv) == "a"sv);

}

static std::optional<section_id> find_section(std::string_view name) noexcept
{
    const auto it = std::lower_bound(
      std::begin(sections),
      std::end(sections),
      name,
      [](const auto& s, const auto n) noexcept { return s.name < n; });

    if (it == std::end(sections) or it->name != name)
        return std::nullopt;

    return it->id;
}

static status read_real(std::string_view val, real& out)
{
    if (auto v = to_real(val); v.has_value()) {
        out = *v;
        return success();
    }

    return new_error(config_errc::bad_real);
}

static status read_integer(std::string_view val, int& out)
{
    if (auto v = to_integer(val); v.has_value()) {
        out = *v;
        return success();
    }

    return new_error(config_errc::bad_integer);
}

static status read_boolean(std::string_view val, bool& out)
{
    if (val == "true" or val == "1" or val == "yes" or val == "on") {
        out = true;
        return success();
    }

    if (val == "false" or val == "0" or val == "no" or val == "off") {
        out = false;
        return success();
    }

    return new_error(config_errc::bad_boolean);
}

static void read_list(std::string_view val, std::vector<std::string>& out)
{
    out.clear();

    while (not val.empty()) {
        const auto comma = val.find(',');
        const auto item  = trim(val.substr(0, comma));

        if (not item.empty())
            out.emplace_back(item);

        if (comma == std::string_view::npos)
            break;

        val = val.substr(comma + 1u);
    }
}

static status read_strategy(std::string_view val, merge_strategy& out)
{
    if (val == "automatic")
        out = merge_strategy::automatic;
    else if (val == "sequential")
        out = merge_strategy::sequential;
    else if (val == "balanced")
        out = merge_strategy::balanced;
    else
        return new_error(config_errc::unknown_key);

    return success();
}

static host_parameters& host_of(configuration& cfg) noexcept
{
    if (not cfg.batch.host.has_value())
        cfg.batch.host.emplace();

    return *cfg.batch.host;
}

static status do_read_affect(configuration&         cfg,
                             const section_id       section,
                             const std::string_view key,
                             const std::string_view val)
{
    if (val.empty())
        return new_error(config_errc::missing_value);

    auto& a = cfg.assembly;
    auto& b = cfg.batch;

    switch (section) {
    case section_id::paths:
        if (key == "model_dir") {
            a.model_dir = val;
            b.model_dir = val;
        } else if (key == "result_dir")
            b.result_dir = val;
        else if (key == "diet_file")
            b.diet_file = val;
        else if (key == "abundance_file")
            a.abundance_file = val;
        else
            return new_error(config_errc::unknown_key);
        return success();

    case section_id::assembly:
        if (key == "organisms")
            read_list(val, a.organisms);
        else if (key == "objective_reaction")
            a.objective_reaction = val;
        else if (key == "strategy")
            return read_strategy(val, a.strategy);
        else if (key == "sequential_threshold")
            return read_integer(val, a.sequential_threshold);
        else if (key == "workers")
            return read_integer(val, a.workers);
        else if (key == "merge_genes")
            return read_boolean(val, a.merge_genes);
        else
            return new_error(config_errc::unknown_key);
        return success();

    case section_id::simulation:
        if (key == "samples")
            read_list(val, b.samples);
        else if (key == "rich_diet")
            return read_boolean(val, b.rich_diet);
        else if (key == "personalized_diet")
            return read_boolean(val, b.personalized_diet);
        else if (key == "save_constrained_models")
            return read_boolean(val, b.save_constrained_models);
        else if (key == "compute_profiles")
            return read_boolean(val, b.compute_profiles);
        else if (key == "include_human_metabolites")
            return read_boolean(val, b.include_human_metabolites);
        else if (key == "force_repeat")
            return read_boolean(val, b.force_repeat);
        else if (key == "validate_flux_magnitude")
            return read_boolean(val, b.validate_flux_magnitude);
        else if (key == "lower_biomass_bound")
            return read_real(val, b.lower_biomass_bound);
        else if (key == "fva_fraction")
            return read_real(val, b.fva_fraction);
        else
            return new_error(config_errc::unknown_key);
        return success();

    case section_id::host:
        if (key == "model_path")
            host_of(cfg).model_path = val;
        else if (key == "biomass_reaction")
            host_of(cfg).biomass_reaction = val;
        else if (key == "biomass_flux_cap")
            return read_real(val, host_of(cfg).biomass_flux_cap);
        else
            return new_error(config_errc::unknown_key);
        return success();

    case section_id::none:
        break;
    }

    return new_error(config_errc::unknown_section);
}

status parse_configuration(configuration& cfg, std::string_view buffer)
{
    auto section = section_id::none;
    int  line    = 0;

    while (not buffer.empty()) {
        const auto str = trim(next_line(buffer));
        ++line;

        if (str.empty() or str.front() == '#' or str.front() == ';')
            continue;

        auto on_line = on_error(e_line{ line });

        if (str.front() == '[') {
            if (str.back() != ']')
                return new_error(config_errc::unknown_section);

            auto id = find_section(trim(str.substr(1u, str.size() - 2u)));
            if (not id.has_value())
                return new_error(config_errc::unknown_section);

            section = *id;
            continue;
        }

        const auto equal = str.find('=');
        if (equal == std::string_view::npos)
            return new_error(config_errc::missing_value);

        mcm_check(do_read_affect(cfg,
                                 section,
                                 trim(str.substr(0, equal)),
                                 trim(str.substr(equal + 1u))));
    }

    return success();
}

result<configuration> load_configuration(const std::filesystem::path& path)
{
    auto on_file = on_error(e_file_name{ path.string() });

    mcm_auto(buffer, read_file_to_buffer(path));

    configuration cfg;
    mcm_check(parse_configuration(cfg, buffer));

    return cfg;
}

journal_handler::journal_handler() noexcept
  : journal_handler(256u)
{}

journal_handler::journal_handler(unsigned capacity) noexcept
  : m_capacity{ std::max(capacity, 4u) }
{}

unsigned journal_handler::count(log_level level) const noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);

    return static_cast<unsigned>(
      std::count_if(m_entries.begin(), m_entries.end(), [&](const auto& e) {
          return ordinal(e.level) <= ordinal(level);
      }));
}

void journal_handler::clear() noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

unsigned journal_handler::capacity() const noexcept { return m_capacity; }

unsigned journal_handler::size() const noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<unsigned>(m_entries.size());
}

u64 journal_handler::get_tick_count_in_milliseconds() noexcept
{
    namespace sc = std::chrono;

    return static_cast<u64>(duration_cast<sc::milliseconds>(
                              sc::steady_clock::now().time_since_epoch())
                              .count());
}

u64 journal_handler::get_elapsed_time(const u64 from) noexcept
{
    return get_tick_count_in_milliseconds() - from;
}

stdfile_journal_consumer::~stdfile_journal_consumer() noexcept
{
    debug::ensure(m_fp);

    if (not(m_fp == stdout or m_fp == stderr))
        std::fclose(m_fp);
}

stdfile_journal_consumer::stdfile_journal_consumer(std::FILE* fp) noexcept
  : m_fp{ fp ? fp : stdout }
{}

stdfile_journal_consumer::stdfile_journal_consumer(
  const std::filesystem::path& path) noexcept
{
    if (auto* out = std::fopen(path.c_str(), "w"); out)
        m_fp = out;
    else
        fmt::print(stderr, "- logging: fail to open {}\n", path.string());

    fmt::print(m_fp, "microcosm start logging\n");
}

void stdfile_journal_consumer::read(journal_handler& jn) noexcept
{
    jn.flush([&](const journal_handler::entry& e) {
        fmt::print(m_fp,
                   "- {}: {}\n  {}\n",
                   log_level_names[ordinal(e.level)],
                   e.title,
                   e.description);
    });

    std::fflush(m_fp);
}

} // namespace mcm
