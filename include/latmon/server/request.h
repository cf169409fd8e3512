#ifndef LATMON_SERVER_REQUEST_H_
#define LATMON_SERVER_REQUEST_H_

#include <map>
#include <string>
#include <vector>

namespace latmon {
namespace server {

struct Request {
    std::string method;
    std::string path;
    std::multimap<std::string, std::string> params;
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

    std::vector<std::string> GetMultiParam(const std::string& key) const {
        std::vector<std::string> values;
        auto range = params.equal_range(key);
        for (auto it = range.first; it != range.second; ++it) {
            values.push_back(it->second);
        }
        return values;
    }
};

struct Response {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

} // namespace server
} // namespace latmon

#endif // LATMON_SERVER_REQUEST_H_
