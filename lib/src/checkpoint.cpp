// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/checkpoint.hpp>
#include <microcosm/file.hpp>

#include "json.hpp"

#include <algorithm>
#include <system_error>

#include <cmath>

#include <rapidjson/document.h>
#include <rapidjson/filewritestream.h>
#include <rapidjson/prettywriter.h>

namespace mcm {

//! Minimum aggregate diet flux of a trusted standard diet profile.
static constexpr real minimum_flux_magnitude = 0.1;

void scenario_result::set_infeasible() noexcept
{
    attempted = true;
    feasible  = false;
    objective.reset();
    net_production.clear();
    net_uptake.clear();
}

std::vector<infeasible_entry> checkpoint_state::infeasible() const
{
    std::vector<infeasible_entry> ret;

    for (const auto& s : samples)
        for (int i = 0; i < scenario_count; ++i)
            if (s.scenarios[i].attempted and not s.scenarios[i].feasible)
                ret.emplace_back(
                  infeasible_entry{ s.sample, enum_cast<scenario>(i) });

    return ret;
}

sample_result* checkpoint_state::find(std::string_view sample) noexcept
{
    const auto it = std::find_if(samples.begin(),
                                 samples.end(),
                                 [&](const auto& s) { return s.sample == sample; });

    return it == samples.end() ? nullptr : &*it;
}

const sample_result* checkpoint_state::find(
  std::string_view sample) const noexcept
{
    const auto it = std::find_if(samples.begin(),
                                 samples.end(),
                                 [&](const auto& s) { return s.sample == sample; });

    return it == samples.end() ? nullptr : &*it;
}

static bool is_requested(const scenario s, const batch_parameters& params)
{
    return s != scenario::personalized or params.personalized_diet;
}

static bool has_profiles(const scenario s, const batch_parameters& params)
{
    return params.compute_profiles and
           (s != scenario::rich or params.rich_diet);
}

bool is_valid(const sample_result& result, const batch_parameters& params)
{
    if (not result.completed)
        return false;

    for (int i = 0; i < scenario_count; ++i) {
        const auto  s = enum_cast<scenario>(i);
        const auto& r = result[s];

        if (not is_requested(s, params))
            continue;

        if (not r.attempted)
            return false;

        if (r.feasible and has_profiles(s, params) and r.net_production.empty())
            return false;
    }

    if (params.validate_flux_magnitude) {
        const auto& r = result[scenario::standard];

        if (r.feasible and r.objective.has_value() and
            *r.objective > params.lower_biomass_bound) {
            real sum = 0.0;
            for (const auto& f : r.net_production)
                if (not std::isnan(f.diet))
                    sum += f.diet;

            if (not(std::abs(sum) > minimum_flux_magnitude))
                return false;
        }
    }

    return true;
}

namespace {

template<typename Writer>
void write_string(Writer& w, std::string_view str)
{
    w.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

template<typename Writer>
void write_profile(Writer& w, const std::vector<net_flux>& profile)
{
    w.StartArray();
    for (const auto& f : profile) {
        w.StartArray();
        w.Double(f.diet);
        w.Double(f.fecal);
        w.EndArray();
    }
    w.EndArray();
}

template<typename Writer>
void write_objective(Writer& w, const scenario_result& r)
{
    if (r.objective.has_value())
        w.Double(*r.objective);
    else
        w.Null();
}

template<typename Writer>
void write_sample(Writer& w, const sample_result& s)
{
    w.StartObject();
    w.Key("id");
    write_string(w, s.sample);
    w.Key("completed");
    w.Bool(s.completed);

    w.Key("scenarios");
    w.StartArray();
    for (const auto& r : s.scenarios) {
        w.StartObject();
        w.Key("attempted");
        w.Bool(r.attempted);
        w.Key("feasible");
        w.Bool(r.feasible);
        w.Key("objective");
        write_objective(w, r);
        w.Key("netProduction");
        write_profile(w, r.net_production);
        w.Key("netUptake");
        write_profile(w, r.net_uptake);
        w.EndObject();
    }
    w.EndArray();

    w.EndObject();
}

auto format_error()
{
    return new_error(checkpoint_errc::format_error);
}

status read_bool(const rapidjson::Value& obj, const char* name, bool& out)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() or not it->value.IsBool())
        return format_error();

    out = it->value.GetBool();
    return success();
}

status read_profile(const rapidjson::Value& obj,
                    const char*             name,
                    std::vector<net_flux>&  out)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() or not it->value.IsArray())
        return format_error();

    out.reserve(it->value.Size());
    for (const auto& elem : it->value.GetArray()) {
        if (not elem.IsArray() or elem.Size() != 2u or
            not elem[0].IsNumber() or not elem[1].IsNumber())
            return format_error();

        out.emplace_back(net_flux{ elem[0].GetDouble(), elem[1].GetDouble() });
    }

    return success();
}

status read_scenario(const rapidjson::Value& val, scenario_result& r)
{
    if (not val.IsObject())
        return format_error();

    mcm_check(read_bool(val, "attempted", r.attempted));
    mcm_check(read_bool(val, "feasible", r.feasible));

    const auto obj = val.FindMember("objective");
    if (obj == val.MemberEnd())
        return format_error();

    if (obj->value.IsNumber())
        r.objective = obj->value.GetDouble();
    else if (not obj->value.IsNull())
        return format_error();

    mcm_check(read_profile(val, "netProduction", r.net_production));
    mcm_check(read_profile(val, "netUptake", r.net_uptake));

    return success();
}

status read_sample(const rapidjson::Value& val, sample_result& s)
{
    if (not val.IsObject())
        return format_error();

    const auto id = val.FindMember("id");
    if (id == val.MemberEnd() or not id->value.IsString())
        return format_error();

    s.sample.assign(id->value.GetString(), id->value.GetStringLength());

    auto on_sample = on_error(e_sample{ s.sample });

    mcm_check(read_bool(val, "completed", s.completed));

    const auto scenarios = val.FindMember("scenarios");
    if (scenarios == val.MemberEnd() or not scenarios->value.IsArray() or
        scenarios->value.Size() != static_cast<rapidjson::SizeType>(scenario_count))
        return format_error();

    for (int i = 0; i < scenario_count; ++i)
        mcm_check(read_scenario(scenarios->value[static_cast<rapidjson::SizeType>(i)],
                                s.scenarios[i]));

    return success();
}

} // namespace

status write_checkpoint(const checkpoint_state& state, std::FILE* fp)
{
    char buffer[4096];

    rapidjson::FileWriteStream os(fp, buffer, sizeof buffer);
    rapidjson::PrettyWriter<rapidjson::FileWriteStream,
                            rapidjson::UTF8<>,
                            rapidjson::UTF8<>,
                            rapidjson::CrtAllocator,
                            rapidjson::kWriteNanAndInfFlag>
      w(os);

    w.SetIndent(' ', 2);
    w.SetFormatOptions(rapidjson::kFormatSingleLineArray);

    w.StartObject();
    w.Key("last-completed");
    w.Int(state.last_completed);

    w.Key("exchanges");
    w.StartArray();
    for (const auto& id : state.exchanges)
        write_string(w, id);
    w.EndArray();

    w.Key("samples");
    w.StartArray();
    for (const auto& s : state.samples)
        write_sample(w, s);
    w.EndArray();

    w.Key("presol");
    w.StartArray();
    for (const auto& s : state.samples) {
        w.StartArray();
        for (const auto& r : s.scenarios)
            write_objective(w, r);
        w.EndArray();
    }
    w.EndArray();

    w.Key("inFesMat");
    w.StartArray();
    for (const auto& entry : state.infeasible()) {
        w.StartObject();
        w.Key("sample");
        write_string(w, entry.sample);
        w.Key("scenario");
        write_string(w, scenario_names[ordinal(entry.which)]);
        w.EndObject();
    }
    w.EndArray();

    w.EndObject();
    os.Flush();

    if (std::ferror(fp))
        return new_error(io_errc::write_error);

    return success();
}

result<checkpoint_state> parse_checkpoint(std::string_view buffer)
{
    rapidjson::Document doc;
    mcm_check(parse_json_data(buffer, doc));

    if (not doc.IsObject())
        return format_error();

    checkpoint_state state;

    const auto last = doc.FindMember("last-completed");
    if (last == doc.MemberEnd() or not last->value.IsInt())
        return format_error();
    state.last_completed = last->value.GetInt();

    const auto exchanges = doc.FindMember("exchanges");
    if (exchanges == doc.MemberEnd() or not exchanges->value.IsArray())
        return format_error();

    for (const auto& elem : exchanges->value.GetArray()) {
        if (not elem.IsString())
            return format_error();
        state.exchanges.emplace_back(elem.GetString(), elem.GetStringLength());
    }

    const auto samples = doc.FindMember("samples");
    if (samples == doc.MemberEnd() or not samples->value.IsArray())
        return format_error();

    state.samples.resize(samples->value.Size());
    for (rapidjson::SizeType i = 0, e = samples->value.Size(); i != e; ++i)
        mcm_check(read_sample(samples->value[i], state.samples[i]));

    if (state.last_completed < -1 or
        state.last_completed >= static_cast<int>(state.samples.size()))
        return format_error();

    return state;
}

checkpoint_store::checkpoint_store(std::filesystem::path result_dir) noexcept
  : m_intermediate(result_dir / "intRes.json")
  , m_final(result_dir / "simRes.json")
{}

status checkpoint_store::save_intermediate(const checkpoint_state& state)
{
    auto on_file = on_error(e_file_name{ m_intermediate.string() });

    return write_atomically(m_intermediate, [&](std::FILE* fp) {
        return write_checkpoint(state, fp);
    });
}

status checkpoint_store::save_final(const checkpoint_state& state)
{
    auto on_file = on_error(e_file_name{ m_final.string() });

    return write_atomically(
      m_final, [&](std::FILE* fp) { return write_checkpoint(state, fp); });
}

static result<std::optional<checkpoint_state>> load_checkpoint(
  const std::filesystem::path& path)
{
    std::error_code ec;
    if (not std::filesystem::exists(path, ec))
        return std::optional<checkpoint_state>{};

    auto on_file = on_error(e_file_name{ path.string() });

    mcm_auto(buffer, read_file_to_buffer(path));
    mcm_auto(state, parse_checkpoint(buffer));

    return std::optional<checkpoint_state>(std::move(state));
}

result<std::optional<checkpoint_state>> checkpoint_store::load_intermediate()
  const
{
    return load_checkpoint(m_intermediate);
}

result<std::optional<checkpoint_state>> checkpoint_store::load_final() const
{
    return load_checkpoint(m_final);
}

} // namespace mcm
