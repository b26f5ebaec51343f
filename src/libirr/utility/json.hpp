/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef libirr_utility_json_hpp
#define libirr_utility_json_hpp

#include <iosfwd>
#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

namespace libirr {
namespace json {

// All of them throw a libirr::Error when the input is not valid JSON
rapidjson::Document parse(const std::string& string);
rapidjson::Document read(const boost::filesystem::path& filename);

// Also throws when the document does not conform to the JSON schema
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);

// Indented output, terminated by a newline
void write(const rapidjson::Value& json, std::ostream& os);

// Compact output
std::string serialize(const rapidjson::Value& json);

}}

#endif
