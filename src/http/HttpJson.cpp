#include "http/HttpJson.hpp"

#include <array>
#include <utility>

#include <boost/json/object.hpp>
#include <boost/json/serializer.hpp>

namespace cds::http {

namespace {

constexpr const char* kJsonContentType = "application/json; charset=utf-8";

const char* reasonPhrase(int statusCode) noexcept {
    switch (statusCode) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 500:
        return "Internal Server Error";
    default:
        return "Unknown";
    }
}

void fill(cds::api::Response& response, int statusCode, std::string body) {
    response.statusCode = statusCode;
    response.statusText = reasonPhrase(statusCode);
    response.contentType = kJsonContentType;
    response.body = std::move(body);
}

}  // namespace

std::string serialize_json(const boost::json::value& value) {
    std::string out;
    std::array<char, 4096> chunk{};

    boost::json::serializer sr;
    sr.reset(&value);
    do {
        const auto piece = sr.read(chunk.data(), chunk.size());
        out.append(piece.data(), piece.size());
    } while (!sr.done());
    return out;
}

void write_json(cds::api::Response& response, const boost::json::value& value) {
    fill(response, 200, serialize_json(value));
}

void json_error(cds::api::Response& response, int statusCode, std::string_view errorCode) {
    boost::json::object body;
    body["error"] = boost::json::string_view(errorCode.data(), errorCode.size());
    fill(response, statusCode, serialize_json(body));
}

}  // namespace cds::http
