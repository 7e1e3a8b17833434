// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/file.hpp>
#include <microcosm/format.hpp>
#include <microcosm/io.hpp>

#include "json.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/filewritestream.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/rapidjson.h>

namespace mcm {

status parse_json_data(std::string_view buffer, rapidjson::Document& doc)
{
    doc.Parse<rapidjson::kParseNanAndInfFlag>(buffer.data(), buffer.size());

    if (doc.HasParseError())
        return new_error(
          io_errc::json_format_error,
          e_json{ static_cast<long long unsigned>(doc.GetErrorOffset()),
                  rapidjson::GetParseError_En(doc.GetParseError()) });

    return success();
}

namespace {

std::string_view to_string_view(const rapidjson::Value& val) noexcept
{
    return std::string_view{ val.GetString(), val.GetStringLength() };
}

auto schema_error(std::string_view what)
{
    return new_error(io_errc::json_schema_error, e_json{ 0, what });
}

status read_string_array(const rapidjson::Value&   val,
                         std::vector<std::string>& out)
{
    if (not val.IsArray())
        return schema_error("array of strings expected");

    out.reserve(val.Size());
    for (const auto& elem : val.GetArray()) {
        if (not elem.IsString())
            return schema_error("array of strings expected");

        out.emplace_back(to_string_view(elem));
    }

    return success();
}

status read_number(const rapidjson::Value& obj,
                   const char*             name,
                   real&                   out,
                   bool                    required)
{
    const auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        if (required)
            return schema_error(name);
        return success();
    }

    if (not it->value.IsNumber())
        return schema_error(name);

    out = it->value.GetDouble();
    return success();
}

struct reaction_header {
    std::string id;
    real        lower     = -default_flux_bound;
    real        upper     = default_flux_bound;
    real        objective = 0.0;
};

status read_reactions(const rapidjson::Value&       val,
                      std::vector<reaction_header>& out)
{
    if (not val.IsArray())
        return schema_error("reactions");

    out.reserve(val.Size());
    for (const auto& elem : val.GetArray()) {
        if (not elem.IsObject())
            return schema_error("reactions");

        auto& rxn = out.emplace_back();

        const auto id = elem.FindMember("id");
        if (id == elem.MemberEnd() or not id->value.IsString())
            return schema_error("id");

        rxn.id = to_string_view(id->value);
        mcm_check(read_number(elem, "lb", rxn.lower, true));
        mcm_check(read_number(elem, "ub", rxn.upper, true));
        mcm_check(read_number(elem, "c", rxn.objective, false));
    }

    return success();
}

status read_stoichiometry(const rapidjson::Value& val,
                          const i32               rows,
                          std::vector<column>&    columns)
{
    if (not val.IsArray())
        return schema_error("S");

    const auto cols = static_cast<i32>(columns.size());

    for (const auto& elem : val.GetArray()) {
        if (not elem.IsArray() or elem.Size() != 3u or
            not elem[0].IsInt() or not elem[1].IsInt() or
            not elem[2].IsNumber())
            return schema_error("S triplet [row, column, value] expected");

        const auto row = elem[0].GetInt();
        const auto col = elem[1].GetInt();

        if (row < 0 or row >= rows or col < 0 or col >= cols)
            return schema_error("S index out of range");

        columns[static_cast<sz>(col)].emplace_back(
          coefficient{ row, elem[2].GetDouble() });
    }

    return success();
}

template<typename Writer>
void write_string_array(Writer& w, const std::vector<std::string>& strings)
{
    w.StartArray();
    for (const auto& str : strings)
        w.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
    w.EndArray();
}

} // namespace

result<model> parse_model(std::string_view buffer)
{
    rapidjson::Document doc;
    mcm_check(parse_json_data(buffer, doc));

    if (not doc.IsObject())
        return schema_error("model object expected");

    model ret;

    if (const auto it = doc.FindMember("name");
        it != doc.MemberEnd() and it->value.IsString())
        ret.name = to_string_view(it->value);

    const auto mets = doc.FindMember("metabolites");
    const auto rxns = doc.FindMember("reactions");
    const auto s    = doc.FindMember("S");

    if (mets == doc.MemberEnd() or rxns == doc.MemberEnd() or
        s == doc.MemberEnd())
        return schema_error("metabolites, reactions and S are required");

    std::vector<std::string> metabolites;
    mcm_check(read_string_array(mets->value, metabolites));

    std::vector<reaction_header> headers;
    mcm_check(read_reactions(rxns->value, headers));

    ret.reserve(metabolites.size(), headers.size());
    for (const auto& id : metabolites)
        mcm_check(ret.add_metabolite(id));

    std::vector<column> columns(headers.size());
    mcm_check(
      read_stoichiometry(s->value, ret.metabolite_count(), columns));

    if (const auto genes = doc.FindMember("genes"); genes != doc.MemberEnd()) {
        ret.genes.emplace();
        mcm_check(read_string_array(genes->value, ret.genes->genes));
    }

    for (sz j = 0; j < headers.size(); ++j)
        mcm_check(ret.add_reaction(headers[j].id,
                                   std::move(columns[j]),
                                   headers[j].lower,
                                   headers[j].upper,
                                   headers[j].objective));

    if (const auto rules = doc.FindMember("rules"); rules != doc.MemberEnd()) {
        if (not ret.genes.has_value())
            ret.genes.emplace();

        ret.genes->rules.clear();
        mcm_check(read_string_array(rules->value, ret.genes->rules));
    }

    mcm_check(ret.validate());

    return ret;
}

result<model> read_model(const std::filesystem::path& path)
{
    auto on_file = on_error(e_file_name{ path.string() });

    mcm_auto(buffer, read_file_to_buffer(path));

    return parse_model(buffer);
}

status write_model(const model& m, std::FILE* fp)
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
    w.Key("name");
    w.String(m.name.data(), static_cast<rapidjson::SizeType>(m.name.size()));

    w.Key("metabolites");
    write_string_array(w, m.metabolites());

    w.Key("reactions");
    w.StartArray();
    for (i32 j = 0, e = m.reaction_count(); j != e; ++j) {
        const auto& id = m.reaction(j);

        w.StartObject();
        w.Key("id");
        w.String(id.data(), static_cast<rapidjson::SizeType>(id.size()));
        w.Key("lb");
        w.Double(m.lower_bound(j));
        w.Key("ub");
        w.Double(m.upper_bound(j));
        if (m.objective(j) != 0.0) {
            w.Key("c");
            w.Double(m.objective(j));
        }
        w.EndObject();
    }
    w.EndArray();

    w.Key("S");
    w.StartArray();
    for (i32 j = 0, e = m.reaction_count(); j != e; ++j) {
        for (const auto& c : m.stoichiometry(j)) {
            w.StartArray();
            w.Int(c.row);
            w.Int(j);
            w.Double(c.value);
            w.EndArray();
        }
    }
    w.EndArray();

    if (m.genes.has_value()) {
        w.Key("genes");
        write_string_array(w, m.genes->genes);
        w.Key("rules");
        write_string_array(w, m.genes->rules);
    }

    w.EndObject();
    os.Flush();

    if (std::ferror(fp))
        return new_error(io_errc::write_error);

    return success();
}

status save_model(const model& m, const std::filesystem::path& path)
{
    auto on_file = on_error(e_file_name{ path.string() });

    return write_atomically(path,
                            [&](std::FILE* fp) { return write_model(m, fp); });
}

} // namespace mcm
