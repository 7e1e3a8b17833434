// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_SRC_JSON_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_SRC_JSON_HPP

#include <microcosm/error.hpp>

#include <string_view>

#include <rapidjson/document.h>

namespace mcm {

//! Parse @a buffer into @a doc (NaN and infinity allowed). A syntax error
//! is reported as @c io_errc::json_format_error with an @c e_json.
status parse_json_data(std::string_view buffer, rapidjson::Document& doc);

} // namespace mcm

#endif
