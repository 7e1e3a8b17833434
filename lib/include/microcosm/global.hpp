// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_GLOBAL_HPP
#define ORG_VLEPROJECT_MICROCOSM_GLOBAL_HPP

#include <microcosm/error.hpp>

#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstdio>

namespace mcm {

//! Enumeration class used everywhere in microcosm to produce log data.
enum class log_level : u8 {
    emergency,
    alert,
    critical,
    error,
    warning,
    notice,
    info,
    debug
};

/**
 * @brief A thread safe log handler. A log entry has a @a log_level, a
 * title, a description and a creation time.
 *
 * Entries are stored in creation order. When the capacity is reached, the
 * oldest entry is removed to make room for the new one.
 */
class journal_handler
{
public:
    struct entry {
        u64         tick = 0;
        log_level   level = log_level::info;
        std::string title;
        std::string description;
    };

    /** Reserve a journal of 256 entries. */
    journal_handler() noexcept;

    explicit journal_handler(unsigned capacity) noexcept;

    /**
     * @brief Add a new entry. The callable @a fn receives the title and the
     * description (two @c std::string) of the new entry to fill.
     *
     * @code
     * jn.push(log_level::warning, [&](auto& title, auto& msg) {
     *     format(title, "Sample {}", sample);
     *     format(msg, "standard diet is infeasible");
     * });
     * @endcode
     */
    template<typename Function, typename... Args>
    void push(log_level level, Function&& fn, Args&&... args)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_entries.size() >= m_capacity)
            m_entries.pop_front();

        auto& e = m_entries.emplace_back();
        e.tick  = get_tick_count_in_milliseconds();
        e.level = level;

        std::invoke(std::forward<Function>(fn),
                    e.title,
                    e.description,
                    std::forward<Args>(args)...);
    }

    /**
     * @brief Wait lock and give access to each entry then clear the
     * journal.
     */
    template<typename Function>
    void flush(Function&& fn)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (const auto& e : m_entries)
            std::invoke(fn, e);

        m_entries.clear();
    }

    template<typename Function>
    void read(Function&& fn) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (const auto& e : m_entries)
            std::invoke(fn, e);
    }

    //! Count the entries with a level lower or equal (more severe) than @a
    //! level.
    unsigned count(log_level level) const noexcept;

    void clear() noexcept;

    unsigned capacity() const noexcept;
    unsigned size() const noexcept;

    static u64 get_tick_count_in_milliseconds() noexcept;
    static u64 get_elapsed_time(const u64 from) noexcept;

private:
    std::deque<entry>  m_entries;
    unsigned           m_capacity = 256;
    mutable std::mutex m_mutex;
};

/**
 * @brief Consume the journal and push into @a stdout by default or in a file @a
 * std::FILE.
 */
class stdfile_journal_consumer
{
    std::FILE* m_fp = stdout;

public:
    stdfile_journal_consumer() noexcept = default;
    ~stdfile_journal_consumer() noexcept;

    explicit stdfile_journal_consumer(std::FILE* fp) noexcept;
    explicit stdfile_journal_consumer(
      const std::filesystem::path& path) noexcept;

    stdfile_journal_consumer(const stdfile_journal_consumer&) = delete;
    stdfile_journal_consumer& operator=(const stdfile_journal_consumer&) =
      delete;

    void read(journal_handler& jn) noexcept;
};

struct host_parameters {
    std::filesystem::path model_path;

    //! Name of the biomass reaction in the host model without the @c Host_
    //! prefix.
    std::string biomass_reaction;

    //! Upper bound of the host biomass flux.
    real biomass_flux_cap = 1.0;
};

enum class merge_strategy : u8 {
    automatic,  //!< sequential above @c sequential_threshold organisms.
    sequential, //!< left fold, two models in memory at most.
    balanced,   //!< binary merge tree.
};

struct assembly_parameters {
    std::filesystem::path    model_dir;
    std::filesystem::path    abundance_file;
    std::vector<std::string> organisms;

    //! Objective reaction of the organism models. Its metabolite is removed
    //! from the exchanged metabolites.
    std::string objective_reaction = "EX_biomass(e)";

    merge_strategy strategy             = merge_strategy::automatic;
    int            sequential_threshold = 500;
    int            workers              = 1;
    bool           merge_genes          = false;
};

//! Dietary scenarios simulated for each sample. The rich scenario is the
//! presolve of the sample: every diet exchange stays open.
enum class scenario : u8 { rich, standard, personalized };

inline constexpr int scenario_count = 3;

static inline constexpr const std::string_view scenario_names[] = {
    "rich",
    "standard",
    "personalized",
};

struct batch_parameters {
    std::filesystem::path          result_dir;
    std::filesystem::path          model_dir;
    std::vector<std::string>       samples;
    std::filesystem::path          diet_file;
    std::optional<host_parameters> host;

    bool rich_diet                 = false;
    bool personalized_diet         = false;
    bool save_constrained_models   = false;
    bool compute_profiles          = true;
    bool include_human_metabolites = true;
    bool force_repeat              = false;

    //! Also reject reloaded flux profiles with an aggregate magnitude under
    //! 0.1 (off by default, the completion marker is authoritative).
    bool validate_flux_magnitude = false;

    real lower_biomass_bound = 0.4;

    //! Fraction of the optimum kept by the flux variability analysis.
    real fva_fraction = 0.99;
};

struct configuration {
    assembly_parameters assembly;
    batch_parameters    batch;
};

/** Fill @a cfg from an ini buffer. Sections are @c [paths], @c [assembly],
 * @c [simulation] and @c [host]. Comments start with @c # or @c ;. Lists are
 * comma separated. Keys not present keep their current value. */
status parse_configuration(configuration& cfg, std::string_view buffer);

/** Read the file @a path and call @c parse_configuration with a default
 * constructed @c configuration. */
result<configuration> load_configuration(const std::filesystem::path& path);

} // namespace mcm

#endif // ORG_VLEPROJECT_MICROCOSM_GLOBAL_HPP
