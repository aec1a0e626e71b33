#include "raw_config.h"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace plexus::config::detail {
namespace {

// Walks a parsed document and records every leaf as a RawScalar under its
// dotted path. Numbers keep full precision so "inf" and "nan" survive.
class ScalarCollector {
public:
    ScalarCollector(RawConfig& out, std::vector<std::string>& warnings)
        : out_(out), warnings_(warnings) {}

    void collect(const toml::table& table, const std::string& prefix) {
        for (const auto& [key, node] : table) {
            const std::string path = prefix.empty() ? std::string{key.str()} : prefix + '.' + std::string{key.str()};
            if (const toml::table* child = node.as_table()) {
                collect(*child, path);
            } else {
                record(path, node);
            }
        }
    }

private:
    void record(const std::string& path, const toml::node& node) {
        const int line = static_cast<int>(node.source().begin.line);
        if (node.is_array()) {
            std::ostringstream oss;
            oss << "Arrays are not supported ('" << path << "' at line " << line << ")";
            warnings_.push_back(oss.str());
            return;
        }

        RawScalar scalar;
        scalar.line = line;
        node.visit([&scalar](const auto& leaf) {
            using Leaf = std::remove_cv_t<std::remove_reference_t<decltype(leaf)>>;
            if constexpr (std::is_same_v<Leaf, toml::value<std::string>>) {
                scalar.kind = RawKind::String;
                scalar.value = leaf.get();
            } else if constexpr (std::is_same_v<Leaf, toml::value<bool>>) {
                scalar.kind = RawKind::Boolean;
                scalar.value = leaf.get() ? "true" : "false";
            } else if constexpr (std::is_same_v<Leaf, toml::value<std::int64_t>>) {
                scalar.kind = RawKind::Number;
                scalar.value = std::to_string(leaf.get());
            } else if constexpr (std::is_same_v<Leaf, toml::value<double>>) {
                std::ostringstream oss;
                oss.precision(17);
                oss << leaf.get();
                scalar.kind = RawKind::Number;
                scalar.value = oss.str();
            } else {
                // Dates and times: kept as text so the loader can name them in a warning.
                std::ostringstream oss;
                oss << leaf;
                scalar.kind = RawKind::Other;
                scalar.value = oss.str();
            }
        });
        out_.scalars[path] = std::move(scalar);
    }

    RawConfig& out_;
    std::vector<std::string>& warnings_;
};

} // namespace

RawConfig parse_raw_config(const std::string& path,
                           std::vector<std::string>& warnings,
                           bool& loaded_file) {
    RawConfig raw;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return raw;
    }

    try {
        const toml::table document = toml::parse_file(path);
        loaded_file = true;
        ScalarCollector(raw, warnings).collect(document, std::string{});
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse '" << path << "': " << err.description() << " (line " << err.source().begin.line
            << ", column " << err.source().begin.column << ")";
        warnings.push_back(oss.str());
    }

    return raw;
}

std::string sanitize_string_value(const std::string& value) {
    std::size_t first = 0;
    std::size_t last = value.size();
    while (first < last && std::isspace(static_cast<unsigned char>(value[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
        --last;
    }
    return value.substr(first, last - first);
}

} // namespace plexus::config::detail
