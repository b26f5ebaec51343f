/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "json.hpp"

#include <fstream>
#include <sstream>

#include <boost/format.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "libirr/Error.hpp"

namespace libirr {
namespace json {

namespace {

std::ifstream openFile(const boost::filesystem::path& filename) {
    auto ifs = std::ifstream{filename.string()};
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % filename;
        IRR_THROW_ERROR(message.str());
    }
    return ifs;
}

std::string describeParseError(const rapidjson::ParseResult& result) {
    auto message = boost::format("Error(offset %u): %s")
        % static_cast<unsigned>(result.Offset())
        % rapidjson::GetParseError_En(result.Code());
    return message.str();
}

// 'origin' names the input in the error message, e.g. the file path
rapidjson::Document parseStream(std::istream& is, const std::string& origin) {
    auto document = rapidjson::Document{};
    rapidjson::IStreamWrapper wrapper(is);
    rapidjson::ParseResult result = document.ParseStream(wrapper);
    if(!result) {
        auto message = boost::format("Error parsing %s. Input data is not valid JSON\n%s")
            % origin % describeParseError(result);
        IRR_THROW_ERROR(message.str());
    }
    return document;
}

template<class Reader>
std::string describeSchemaViolation(const Reader& reader) {
    auto toString = [](const rapidjson::Pointer& pointer) {
        auto buffer = rapidjson::StringBuffer{};
        pointer.StringifyUriFragment(buffer);
        return std::string{buffer.GetString()};
    };

    auto report = rapidjson::StringBuffer{};
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(report);
    reader.GetError().Accept(writer);

    auto message = boost::format("Invalid schema: %s\nInvalid keyword: %s\nInvalid document: %s\nError report:\n%s")
        % toString(reader.GetInvalidSchemaPointer())
        % reader.GetInvalidSchemaKeyword()
        % toString(reader.GetInvalidDocumentPointer())
        % report.GetString();
    return message.str();
}

}

rapidjson::Document parse(const std::string& string) {
    auto iss = std::istringstream{string};
    return parseStream(iss, (boost::format("JSON string '%s'") % string).str());
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    auto ifs = openFile(filename);
    return parseStream(ifs, (boost::format("JSON file %s") % filename).str());
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    using ValidatingReader = rapidjson::SchemaValidatingReader<
        rapidjson::kParseDefaultFlags, rapidjson::IStreamWrapper, rapidjson::UTF8<>>;

    auto document = rapidjson::Document{};
    try {
        auto schemaDocument = read(schemaFile);
        rapidjson::SchemaDocument schema(schemaDocument);

        auto ifs = openFile(jsonFile);
        rapidjson::IStreamWrapper wrapper(ifs);
        ValidatingReader reader(wrapper, schema);
        document.Populate(reader);

        if(!reader.GetParseResult()) {
            if(!reader.IsValid()) {
                IRR_THROW_ERROR(describeSchemaViolation(reader));
            }
            IRR_THROW_ERROR(describeParseError(reader.GetParseResult()));
        }
    }
    catch(libirr::Error& e) {
        auto message = boost::format("Error reading JSON file %s") % jsonFile;
        IRR_RETHROW_ERROR(e, message.str());
    }
    return document;
}

void write(const rapidjson::Value& json, std::ostream& os) {
    rapidjson::OStreamWrapper wrapper(os);
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(wrapper);
    writer.SetIndent(' ', 2);
    json.Accept(writer);
    os << std::endl;
}

std::string serialize(const rapidjson::Value& json) {
    auto buffer = rapidjson::StringBuffer{};
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    return buffer.GetString();
}

}}
