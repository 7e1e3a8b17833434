// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/assembly.hpp>
#include <microcosm/error.hpp>
#include <microcosm/global.hpp>
#include <microcosm/io.hpp>
#include <microcosm/simulation.hpp>

#if defined(MICROCOSM_HAVE_GLPK)
#include <microcosm/glpk-solver.hpp>
#endif

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <cstring>

static void show_help() noexcept
{
    std::puts(R"(
microcosm-cli [-h][-v][-c file][-o dir][-w n][-f] action...

Options:
  -h, --help               This help message
  -v, --version            The version of microcosm
  -c file                  Read the configuration file. Options on the
  --config file            right of this option override its values.
  -o dir                   The result directory: community models and
  --output dir             checkpoints.
  -w n                     Number of workers used to merge the organism
  --workers n              models.
  -f, --force              Simulate again every sample even if a valid
                           checkpoint exists.

Actions:
  assemble                 Build the setup model from the organism models
                           and the host model, then the community model of
                           each sample of the abundance file.
  simulate                 Run the dietary scenarios of each sample.

Examples:
$ microcosm-cli -c study.ini -w4 assemble simulate

        Will read the `study.ini' configuration, build the community models
        with four workers then simulate each sample.

)");
}

static void show_version() noexcept
{
#if !defined(VERSION_MAJOR)
#define VERSION_MAJOR "major version undefined"
#endif
#if !defined(VERSION_MINOR)
#define VERSION_MINOR "minor version undefined"
#endif
#if !defined(VERSION_PATCH)
#define VERSION_PATCH "patch version undefined"
#endif

    fmt::print(
      "microcosm-cli {}.{}.{}\n\n", VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH);
}

struct report_parameter {
    std::string_view str;
    int              arg;
};

enum class ec : mcm::u8 {
    arg_missing,
    unknown_option,
    unknown_action,
    bad_int,
    open_file,
    io_error,
    json_file,
    json_schema,
    table_file,
    config_file,
    model_error,
    merge_error,
    assembly_error,
    unknown_organism,
    constraint_error,
    checkpoint_error,
    simulation_error,
    solver_missing,
    unknown_error
};

static constexpr report_parameter report_parameters[] = {
    { "argument missing for {}\n", 1 },
    { "unknown option {}\n", 1 },
    { "unknown action {}\n", 1 },
    { "parameter `{}' is not an integer\n", 1 },
    { "open file `{}' error: {}\n", 2 },
    { "file `{}' input/output error {}\n", 2 },
    { "json format error in `{}' at offset {}: {}\n", 3 },
    { "json model error in `{}'\n", 1 },
    { "table format error in `{}' line {}\n", 2 },
    { "configuration error {} in `{}' line {}\n", 3 },
    { "model error {} (reaction `{}')\n", 2 },
    { "merge error {} (`{}')\n", 2 },
    { "assembly error {}\n", 1 },
    { "organism model `{}' not found\n", 1 },
    { "constraint error {} (reaction `{}')\n", 2 },
    { "checkpoint error {}\n", 1 },
    { "simulation error {}\n", 1 },
    { "no linear program solver available\n", 0 },
    { "unknown error\n", 0 }
};

template<ec Index, typename... Args>
static constexpr void warning(Args&&... args) noexcept
{
    constexpr auto idx = static_cast<std::underlying_type_t<ec>>(Index);

    mcm::debug::ensure(sizeof...(args) == report_parameters[idx].arg);

    fmt::vprint(
      stderr, report_parameters[idx].str, fmt::make_format_args(args...));
}

template<ec Index, typename Ret, typename... Args>
static constexpr auto error(Ret&& ret, Args&&... args) noexcept -> Ret
{
    constexpr auto idx = static_cast<std::underlying_type_t<ec>>(Index);

    mcm::debug::ensure(sizeof...(args) == report_parameters[idx].arg);

    fmt::vprint(stderr,
                fg(fmt::terminal_color::red),
                report_parameters[idx].str,
                fmt::make_format_args(args...));

    return ret;
}

enum class option_id : mcm::u8 {
    unknown,
    config,
    force,
    help,
    output,
    version,
    workers
};

struct option {
    const std::string_view short_opt;
    const std::string_view long_opt;
    const option_id        id;
    const mcm::u8          min_arg;
    const mcm::u8          max_arg;
};

static inline constexpr option options[] = {
    { "c", "config", option_id::config, 1, 1 },
    { "f", "force", option_id::force, 0, 0 },
    { "h", "help", option_id::help, 0, 0 },
    { "o", "output", option_id::output, 1, 1 },
    { "v", "version", option_id::version, 0, 0 },
    { "w", "workers", option_id::workers, 1, 1 },
};

static constexpr const option* get_from_short(std::string_view name) noexcept
{
    const auto it = std::find_if(
      std::begin(options), std::end(options), [&](const auto& opt) noexcept {
          return name.substr(0, 1) == opt.short_opt;
      });

    return it == std::end(options) ? nullptr : it;
}

static constexpr const option* get_from_long(std::string_view name) noexcept
{
    const auto it = std::find_if(
      std::begin(options), std::end(options), [&](const auto& opt) noexcept {
          const auto str = name.substr(2);
          if (not str.starts_with(opt.long_opt))
              return false;

          // The option name ends the token or is followed by its argument.
          const auto end = opt.long_opt.size();
          return str.size() == end or str[end] == '=' or str[end] == ':';
      });

    return it == std::end(options) ? nullptr : it;
}

static_assert(get_from_long("--config") != nullptr);
static_assert(get_from_long("--config=study.ini") != nullptr);
static_assert(get_from_long("--output:results") != nullptr);
static_assert(get_from_long("--configfoo") == nullptr);
static_assert(get_from_long("--forced") == nullptr);

class main_parameters
{
    mcm::journal_handler                jn;
    mcm::stdfile_journal_consumer       out;
    mcm::configuration                  cfg;
    std::optional<mcm::abundance_table> abundances;

    std::span<const char*> args;
    std::string_view       front;

    int u = 0; // Temp variable used during parse operation.

public:
    main_parameters(int ac, const char* av[])
      : out(stderr)
      , args{ av + 1, static_cast<std::size_t>(ac - 1) }
    {
        load_next_token();
    }

    mcm::status create_result_dir() noexcept
    {
        if (cfg.batch.result_dir.empty())
            cfg.batch.result_dir = ".";

        std::error_code ec;
        std::filesystem::create_directories(cfg.batch.result_dir, ec);

        if (ec)
            return mcm::new_error(
              mcm::io_errc::directory_error,
              mcm::e_file_name{ cfg.batch.result_dir.string() },
              mcm::e_errno{ ec.value() });

        return mcm::success();
    }

    mcm::status load_abundances() noexcept
    {
        if (abundances.has_value() or cfg.assembly.abundance_file.empty())
            return mcm::success();

        mcm_auto(table, mcm::read_abundance_file(cfg.assembly.abundance_file));
        abundances = std::move(table);

        return mcm::success();
    }

    bool is_selected(std::string_view sample) const noexcept
    {
        const auto& samples = cfg.batch.samples;

        return samples.empty() or
               std::find(samples.begin(), samples.end(), sample) !=
                 samples.end();
    }

    mcm::status assemble() noexcept
    {
        mcm_check(create_result_dir());

        mcm::json_model_store store(cfg.assembly.model_dir,
                                    cfg.batch.result_dir);

        std::optional<mcm::model> host;
        if (cfg.batch.host.has_value()) {
            mcm_auto(m, mcm::read_model(cfg.batch.host->model_path));
            host = std::move(m);
        }

        const mcm::model_loader load = [&](std::string_view name) {
            return store.load_organism(name);
        };

        mcm_auto(setup,
                 mcm::assemble_community(
                   cfg.assembly, load, host ? &*host : nullptr, {}, &jn));

        mcm_check(mcm::save_model(setup, cfg.batch.result_dir / "setup.json"));

        mcm_check(load_abundances());
        if (not abundances.has_value())
            return mcm::success();

        const auto&            table = *abundances;
        std::vector<mcm::real> values(table.organisms.size());

        for (mcm::sz s = 0; s < table.samples.size(); ++s) {
            if (not is_selected(table.samples[s]))
                continue;

            for (mcm::sz o = 0; o < table.organisms.size(); ++o)
                values[o] = table.at(o, s);

            auto on_sample = mcm::on_error(mcm::e_sample{ table.samples[s] });

            mcm_auto(community,
                     mcm::personalize_community(setup, table.organisms, values));
            mcm_check(
              store.save_sample(table.samples[s], host.has_value(), community));

            jn.push(mcm::log_level::info, [&](auto& title, auto& msg) {
                mcm::format(title, "Sample {}", table.samples[s]);
                mcm::format(msg,
                            "{} metabolites, {} reactions",
                            community.metabolite_count(),
                            community.reaction_count());
            });
        }

        return mcm::success();
    }

    mcm::status simulate() noexcept
    {
        mcm_check(create_result_dir());

        if (cfg.batch.samples.empty()) {
            mcm_check(load_abundances());
            if (abundances.has_value())
                cfg.batch.samples = abundances->samples;
        }

        mcm_auto(diet, mcm::read_diet_file(cfg.batch.diet_file));

#if defined(MICROCOSM_HAVE_GLPK)
        mcm::json_model_store store(cfg.batch.model_dir, cfg.batch.result_dir);
        mcm::glpk_solver      solver;
        mcm::lp_flux_variability fva(solver, cfg.batch.fva_fraction);

        mcm_auto(state,
                 mcm::run_batch(cfg.batch,
                                store,
                                solver,
                                fva,
                                diet,
                                jn,
                                {},
                                [&](const mcm::sample_result&) { out.read(jn); }));

        fmt::print("{} samples simulated, {} infeasible scenarios\n",
                   state.samples.size(),
                   state.infeasible().size());

        return mcm::success();
#else
        return mcm::new_error(mcm::simulation_errc::solver_missing);
#endif
    }

    /** Run the action @a fn and report its errors on @c stderr.
     * @return true if the action succeeded. */
    template<typename Function>
    bool report(Function&& fn) noexcept
    {
        const auto ret = mcm::attempt_all(
          [&]() -> mcm::result<bool> {
              mcm_check(fn());
              return true;
          },
          [](mcm::match<mcm::io_errc, mcm::io_errc::open_error>,
             const mcm::e_file_name& file,
             const mcm::e_errno&     e) {
              return error<ec::open_file>(
                false, file.sv(), std::strerror(e.value));
          },
          [](const mcm::io_errc,
             const mcm::e_file_name& file,
             const mcm::e_json&      e) {
              return error<ec::json_file>(
                false, file.sv(), e.offset, std::string_view{ e.error_code });
          },
          [](mcm::match<mcm::io_errc, mcm::io_errc::json_schema_error>,
             const mcm::e_file_name& file) {
              return error<ec::json_schema>(false, file.sv());
          },
          [](mcm::match<mcm::io_errc, mcm::io_errc::table_format_error>,
             const mcm::e_file_name& file,
             const mcm::e_line&      line) {
              return error<ec::table_file>(false, file.sv(), line.value);
          },
          [](const mcm::io_errc code, const mcm::e_file_name& file) {
              return error<ec::io_error>(false, file.sv(), mcm::ordinal(code));
          },
          [](const mcm::config_errc   code,
             const mcm::e_file_name& file,
             const mcm::e_line&      line) {
              return error<ec::config_file>(
                false, mcm::ordinal(code), file.sv(), line.value);
          },
          [](const mcm::model_errc code, const mcm::e_reaction& id) {
              return error<ec::model_error>(false, mcm::ordinal(code), id.sv());
          },
          [](const mcm::model_errc code) {
              return error<ec::model_error>(
                false, mcm::ordinal(code), std::string_view{});
          },
          [](const mcm::merge_errc code, const mcm::e_reaction& id) {
              return error<ec::merge_error>(false, mcm::ordinal(code), id.sv());
          },
          [](const mcm::merge_errc code, const mcm::e_metabolite& id) {
              return error<ec::merge_error>(false, mcm::ordinal(code), id.sv());
          },
          [](const mcm::merge_errc code) {
              return error<ec::merge_error>(
                false, mcm::ordinal(code), std::string_view{});
          },
          [](mcm::match<mcm::assembly_errc,
                        mcm::assembly_errc::unknown_organism>,
             const mcm::e_file_name& file) {
              return error<ec::unknown_organism>(false, file.sv());
          },
          [](const mcm::assembly_errc code) {
              return error<ec::assembly_error>(false, mcm::ordinal(code));
          },
          [](const mcm::constraint_errc code, const mcm::e_reaction& id) {
              return error<ec::constraint_error>(
                false, mcm::ordinal(code), id.sv());
          },
          [](const mcm::checkpoint_errc code) {
              return error<ec::checkpoint_error>(false, mcm::ordinal(code));
          },
          [](mcm::match<mcm::simulation_errc,
                        mcm::simulation_errc::solver_missing>) {
              return error<ec::solver_missing>(false);
          },
          [](const mcm::simulation_errc code) {
              return error<ec::simulation_error>(false, mcm::ordinal(code));
          },
          []() { return error<ec::unknown_error>(false); });

        out.read(jn);

        return ret;
    }

    constexpr void load_next_token() noexcept
    {
        if (args.empty()) {
            front = std::string_view{};
        } else {
            front = args.front();
            args  = args.subspan(1u);
        }
    }

    constexpr void consume_data(const std::size_t nb) noexcept
    {
        if (nb < front.size())
            front = front.substr(nb);
        else
            load_next_token();
    }

    constexpr bool start_short_option() const noexcept
    {
        mcm::debug::ensure(not front.empty());
        return front.size() > 1 and front[0] == '-' and front[1] != '-';
    }

    constexpr bool start_long_option() const noexcept
    {
        mcm::debug::ensure(not front.empty());
        return front.size() > 2 and front.substr(0, 2) == "--";
    }

    bool parse_integer() noexcept
    {
        if (const auto ret =
              std::from_chars(front.data(), front.data() + front.size(), u);
            ret.ec == std::errc{} and ret.ptr == front.data() + front.size()) {
            load_next_token();
            return true;
        }

        return error<ec::bad_int>(false, front);
    }

    bool read_workers() noexcept
    {
        if (front.empty())
            return error<ec::arg_missing>(false, "workers");

        if (parse_integer() and u > 0) {
            cfg.assembly.workers = u;
            return true;
        }

        return false;
    }

    bool read_config() noexcept
    {
        if (front.empty())
            return error<ec::arg_missing>(false, "config");

        const std::filesystem::path path{ front };
        load_next_token();

        return report([&]() -> mcm::status {
            mcm_auto(loaded, mcm::load_configuration(path));
            cfg = std::move(loaded);
            abundances.reset();
            return mcm::success();
        });
    }

    bool read_output_dir() noexcept
    {
        if (front.empty())
            return error<ec::arg_missing>(false, "output");

        cfg.batch.result_dir = std::filesystem::path{ front };
        load_next_token();

        return true;
    }

    /* Options with an argument accept `-wN', `-w N', `-w=N' and `-w:N'. */
    bool dispatch(const option& opt) noexcept
    {
        if (opt.min_arg > 0 and not front.empty() and
            (front[0] == '=' or front[0] == ':'))
            consume_data(1u);

        switch (opt.id) {
        case option_id::help:
            show_help();
            return true;

        case option_id::version:
            show_version();
            return true;

        case option_id::force:
            cfg.batch.force_repeat = true;
            return true;

        case option_id::config:
            return read_config();

        case option_id::output:
            return read_output_dir();

        case option_id::workers:
            return read_workers();

        case option_id::unknown:
            break;
        }

        return error<ec::unknown_option>(false, front);
    }

    /** Consume all characters of the @c front token. An option with an
     * argument ends the token. */
    bool read_short_options() noexcept
    {
        consume_data(1u);

        for (;;) {
            const auto ptr = get_from_short(front);
            if (not ptr)
                return error<ec::unknown_option>(false, front);

            const bool last = ptr->min_arg > 0 or front.size() == 1u;
            consume_data(1u);

            if (not dispatch(*ptr))
                return false;

            if (last)
                return true;
        }
    }

    bool read_long_option() noexcept
    {
        if (const auto ptr = get_from_long(front); ptr) {
            consume_data(2u + ptr->long_opt.size());
            return dispatch(*ptr);
        }

        return error<ec::unknown_option>(false, front);
    }

    bool read_argument() noexcept
    {
        mcm::debug::ensure(not front.empty());

        const auto action = front;
        load_next_token();

        if (action == "assemble")
            return report([&]() { return assemble(); });

        if (action == "simulate")
            return report([&]() { return simulate(); });

        return error<ec::unknown_action>(false, action);
    }

    bool parse_args() noexcept
    {
        return start_short_option()  ? read_short_options()
               : start_long_option() ? read_long_option()
                                     : read_argument();
    }

    /** Consume all argument from the command line interface and return true
     * if every action succeeded. */
    bool parse() noexcept
    {
        while (not front.empty() and parse_args())
            ;

        return front.empty() and args.empty();
    }
};

int main(int argc, const char* argv[])
{
#ifdef MICROCOSM_ENABLE_DEBUG
    mcm::on_error_callback = mcm::debug::breakpoint;
#endif

    main_parameters m{ argc, argv };

    return m.parse() ? 0 : 1;
}
