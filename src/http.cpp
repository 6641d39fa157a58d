#include "http.hpp"
#include "util.hpp"

#include <algorithm>

namespace manax {

std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return h.second;
    }
    return "";
}

void set_header(std::vector<Header>& headers, const std::string& name,
                const std::string& value) {
    for (auto& h : headers) {
        if (iequals(h.first, name)) {
            h.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string StreamResponse::read_all(size_t limit) {
    std::string out;
    char buf[4096];
    while (out.size() < limit) {
        size_t want = std::min(sizeof(buf), limit - out.size());
        size_t n = read_some(buf, want);
        if (n == 0) break;
        out.append(buf, n);
    }
    return out;
}

} // namespace manax
