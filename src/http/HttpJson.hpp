#pragma once

#include <string>
#include <string_view>

#include <boost/json/value.hpp>

#include "api/Response.hpp"

namespace cds::http {

std::string serialize_json(const boost::json::value& value);

// Fills body, status 200 and the JSON content type.
void write_json(cds::api::Response& response, const boost::json::value& value);

// Writes {"error":"<errorCode>"} with the given status.
void json_error(cds::api::Response& response, int statusCode, std::string_view errorCode);

}  // namespace cds::http
