#include "checker/json_diff.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace das_integrity {

namespace {

struct Difference {
    std::string path;
    const nlohmann::json* lhs;
    const nlohmann::json* rhs;
};

std::string indent(const std::string& text, size_t spaces) {
    const std::string pad(spaces, ' ');
    std::ostringstream out;
    std::istringstream in(text);
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        if (!first) {
            out << '\n';
        }
        out << pad << line;
        first = false;
    }
    return out.str();
}

// Numbers of the same kind compare by value; integer vs float is a type mismatch
bool same_kind(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) {
        return a.is_number_float() == b.is_number_float();
    }
    return a.type() == b.type();
}

class DiffCollector {
public:
    void collect(const nlohmann::json& lhs, const nlohmann::json& rhs, const std::string& path) {
        if (lhs.is_object() && rhs.is_object()) {
            std::set<std::string> keys;
            for (auto it = lhs.begin(); it != lhs.end(); ++it) keys.insert(it.key());
            for (auto it = rhs.begin(); it != rhs.end(); ++it) keys.insert(it.key());

            for (const auto& key : keys) {
                const std::string child = path + "." + key;
                auto l = lhs.find(key);
                auto r = rhs.find(key);
                if (l == lhs.end()) {
                    diffs_.push_back({child, nullptr, &*r});
                } else if (r == rhs.end()) {
                    diffs_.push_back({child, &*l, nullptr});
                } else {
                    collect(*l, *r, child);
                }
            }
            return;
        }

        if (lhs.is_array() && rhs.is_array()) {
            const size_t n = std::max(lhs.size(), rhs.size());
            for (size_t i = 0; i < n; ++i) {
                const std::string child = path + "[" + std::to_string(i) + "]";
                if (i >= lhs.size()) {
                    diffs_.push_back({child, nullptr, &rhs[i]});
                } else if (i >= rhs.size()) {
                    diffs_.push_back({child, &lhs[i], nullptr});
                } else {
                    collect(lhs[i], rhs[i], child);
                }
            }
            return;
        }

        if (!same_kind(lhs, rhs) || lhs != rhs) {
            diffs_.push_back({path, &lhs, &rhs});
        }
    }

    const std::vector<Difference>& diffs() const { return diffs_; }

private:
    std::vector<Difference> diffs_;
};

std::string format_path(const std::string& path) {
    return path.empty() ? "(root)" : path;
}

std::string format_difference(const Difference& d) {
    std::ostringstream out;
    const std::string path = format_path(d.path);
    if (d.lhs && d.rhs) {
        out << "json atoms at path \"" << path << "\" are not equal:\n";
        out << "    lhs:\n" << indent(d.lhs->dump(2), 8) << '\n';
        out << "    rhs:\n" << indent(d.rhs->dump(2), 8);
    } else if (d.rhs) {
        out << "json atom at path \"" << path << "\" is missing from lhs";
    } else {
        out << "json atom at path \"" << path << "\" is missing from rhs";
    }
    return out.str();
}

} // namespace

std::optional<std::string> compare_json_strict(const nlohmann::json& lhs, const nlohmann::json& rhs) {
    DiffCollector collector;
    collector.collect(lhs, rhs, "");
    if (collector.diffs().empty()) {
        return std::nullopt;
    }

    std::string result;
    for (const auto& d : collector.diffs()) {
        if (!result.empty()) {
            result += "\n\n";
        }
        result += format_difference(d);
    }
    return result;
}

std::optional<std::string> filter_diff(std::string diff, const std::vector<std::regex>& regexes) {
    for (const auto& re : regexes) {
        diff = std::regex_replace(diff, re, "");
    }
    if (diff.empty()) {
        return std::nullopt;
    }
    return diff;
}

} // namespace das_integrity
