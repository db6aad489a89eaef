#pragma once

#include <map>
#include <string>
#include <vector>

namespace apptrace {
namespace server {

struct Request {
    std::string method;
    std::string path;
    std::multimap<std::string, std::string> params;
    std::map<std::string, std::string> path_params;
    std::string body;
    std::map<std::string, std::string> headers;

    bool HasParam(const std::string& key) const {
        return params.find(key) != params.end();
    }

    std::string GetParam(const std::string& key) const {
        auto it = params.find(key);
        if (it != params.end()) {
            return it->second;
        }
        return "";
    }

    std::string GetPathParam(const std::string& key) const {
        auto it = path_params.find(key);
        if (it != path_params.end()) {
            return it->second;
        }
        return "";
    }
};

struct Response {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

} // namespace server
} // namespace apptrace
