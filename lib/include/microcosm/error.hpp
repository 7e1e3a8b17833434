// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_ERROR_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_ERROR_HPP

#include <microcosm/macros.hpp>

#include <algorithm>
#include <memory>
#include <string_view>

#include <cerrno>

#define BOOST_LEAF_EMBEDDED
#include <boost/leaf.hpp>

#define mcm_check BOOST_LEAF_CHECK
#define mcm_auto BOOST_LEAF_AUTO

namespace mcm {

template<typename T, T... value>
using match = boost::leaf::match<T, value...>;

template<class T>
using result = boost::leaf::result<T>;

using status = result<void>;

using error_handler = void(void) noexcept;

inline error_handler* on_error_callback = nullptr;

//! Structural errors on a single @c model: the stoichiometry does not fit
//! the metabolite or reaction lists or an identifier is duplicated.
enum class model_errc : u8 {
    dimension_mismatch,
    duplicated_metabolite,
    duplicated_reaction,
    unknown_metabolite,
    gene_table_mismatch,
};

//! Errors reported by the @c merge function and the merge tree scheduler.
enum class merge_errc : u8 {
    metabolite_collision,
    reaction_collision,
    empty_organism_list,
    leftover_lost,
    worker_failure,
};

//! Errors reported during the assembly of a community model (host
//! coupling, compartments and community biomass).
enum class assembly_errc : u8 {
    empty_exchange_list,
    bad_exchange_metabolite,
    missing_organism_biomass,
    empty_abundance,
    unknown_organism,
};

//! Errors reported by the constraint policy. A missing @c communityBiomass
//! or host biomass reaction stops the batch.
enum class constraint_errc : u8 {
    missing_community_biomass,
    missing_objective,
    missing_host_biomass,
};

enum class io_errc : u8 {
    open_error,
    read_error,
    write_error,
    rename_error,
    directory_error,
    json_format_error,
    json_schema_error,
    table_format_error,
};

enum class checkpoint_errc : u8 {
    format_error,
};

enum class simulation_errc : u8 {
    empty_sample_list,
    solver_missing,
    solver_failure,
    personalized_diet_missing,
    flux_variability_failure,
};

enum class config_errc : u8 {
    unknown_section,
    unknown_key,
    bad_real,
    bad_integer,
    bad_boolean,
    missing_value,
};

namespace details {

template<std::size_t N>
struct e_string {
    e_string() noexcept = default;

    e_string(std::string_view str) noexcept
    {
        const auto len = std::min(str.size(), N - 1u);

        std::uninitialized_copy_n(str.data(), len, value);
        value[len] = '\0';
    }

    std::string_view sv() const noexcept { return value; }

    char value[N] = {};
};

} // namespace details

struct e_file_name : details::e_string<256> {
    using details::e_string<256>::e_string;
};

struct e_reaction : details::e_string<128> {
    using details::e_string<128>::e_string;
};

struct e_metabolite : details::e_string<128> {
    using details::e_string<128>::e_string;
};

struct e_sample : details::e_string<128> {
    using details::e_string<128>::e_string;
};

//! Line number in a configuration, diet or abundance file.
struct e_line {
    int value = 0;
};

struct e_errno {
    e_errno() noexcept = default;

    e_errno(int value_) noexcept
      : value{ value_ }
    {}

    int value = errno;
};

struct e_json {
    e_json() noexcept = default;

    e_json(long long unsigned int offset_, std::string_view str) noexcept
      : offset(offset_)
    {
        const auto len =
          str.size() > sizeof error_code - 1u ? sizeof error_code - 1u
                                              : str.size();

        std::uninitialized_copy_n(str.data(), len, error_code);
        error_code[len] = '\0';
    }

    long long unsigned int offset = 0;
    char                   error_code[64] = {};
};

/**
 * @brief a readability function for returning successful results;
 *
 * For functions that return `status`, rather than returning `{}` to default
 * initialize the status object as "success", use this function to make it more
 * clear to the reader.
 */
inline status success()
{
    status successful_status{};
    return successful_status;
}

template<class TryBlock, class... H>
[[nodiscard]] constexpr auto attempt(TryBlock&& p_try_block, H&&... p_handlers)
{
    return boost::leaf::try_handle_some(p_try_block, p_handlers...);
}

template<class TryBlock, class... H>
[[nodiscard]] constexpr auto attempt_all(TryBlock&& p_try_block,
                                         H&&... p_handlers)
{
    return boost::leaf::try_handle_all(p_try_block, p_handlers...);
}

template<class... Item>
[[nodiscard]] constexpr auto on_error(Item&&... p_item)
{
    return boost::leaf::on_error(std::forward<Item>(p_item)...);
}

template<class... Item>
[[nodiscard]] inline auto new_error(Item&&... p_item)
{
    if (on_error_callback) {
        on_error_callback();
    }

    return boost::leaf::new_error(std::forward<Item>(p_item)...);
}

} // namespace mcm

#endif
