#include "codec/source_dict.hpp"

#include <algorithm>

namespace marquise {

static bool valid_token(const std::string& s) {
    return s.find(':') == std::string::npos && s.find(',') == std::string::npos;
}

bool SourceDict::decode(const uint8_t* data, size_t len, SourceDict& out) {
    out.pairs_.clear();
    if (len == 0) return true;

    const char* p = reinterpret_cast<const char*>(data);
    const char* end = p + len;

    for (;;) {
        const char* comma = std::find(p, end, ',');
        const char* colon = std::find(p, comma, ':');
        if (colon == comma) return false;   // no separator in this pair

        std::string key(p, colon);
        std::string value(colon + 1, comma);
        if (key.empty()) return false;
        if (!valid_token(value)) return false;   // second ':' in the pair
        if (!out.set(key, value)) return false;  // duplicate key

        if (comma == end) break;
        p = comma + 1;
    }
    return true;
}

std::string SourceDict::encode() const {
    std::string s;
    for (size_t i = 0; i < pairs_.size(); ++i) {
        if (i > 0) s.push_back(',');
        s += pairs_[i].first;
        s.push_back(':');
        s += pairs_[i].second;
    }
    return s;
}

Fingerprint SourceDict::fingerprint() const {
    std::string canonical = encode();
    return fnv1a64(reinterpret_cast<const uint8_t*>(canonical.data()),
                   canonical.size());
}

bool SourceDict::set(const std::string& key, const std::string& value) {
    if (key.empty() || !valid_token(key) || !valid_token(value)) return false;

    auto it = std::lower_bound(pairs_.begin(), pairs_.end(), key,
                               [](const Pair& a, const std::string& k) {
                                   return a.first < k;
                               });
    if (it != pairs_.end() && it->first == key) return false;
    pairs_.insert(it, Pair(key, value));
    return true;
}

const std::string* SourceDict::get(const std::string& key) const {
    auto it = std::lower_bound(pairs_.begin(), pairs_.end(), key,
                               [](const Pair& a, const std::string& k) {
                                   return a.first < k;
                               });
    if (it == pairs_.end() || it->first != key) return nullptr;
    return &it->second;
}

} // namespace marquise
