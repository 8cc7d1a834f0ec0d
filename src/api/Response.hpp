#pragma once

#include <string>

namespace cds::api {

struct Response {
    int statusCode = 200;
    std::string statusText;
    std::string body;
    std::string contentType;
};

}  // namespace cds::api
