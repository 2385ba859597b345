#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shadowsync {

// Dot-delimited subscription pattern.
//   '*' matches exactly one non-empty segment.
//   '#' matches zero or more whole segments; only valid as the final segment
//       or as the whole pattern.
// Patterns without wildcards match by plain string comparison. Wildcard
// patterns are compiled to a segment list on first use; the compiled form is
// shared process-wide through pattern_cache. Matching walks the topic once
// and does not recurse, so topic length is unbounded.
struct compiled_pattern {
    struct segment {
        bool any = false;  // '*'
        std::string literal;
    };

    std::vector<segment> segments;
    bool trailing_hash = false;  // pattern ends in '#'

    // Compile a validated wildcard pattern.
    static compiled_pattern compile(std::string_view pattern);

    bool matches(std::string_view topic) const;
};

class topic_pattern {
public:
    // Throws invalid_pattern_error on misplaced or partial wildcards.
    explicit topic_pattern(std::string pattern);

    bool matches(std::string_view topic) const;

    const std::string& str() const { return m_pattern; }
    bool has_wildcards() const { return m_wildcard; }

    // Literal segments before the first wildcard ("devices" for "devices.*.x").
    std::string literal_prefix() const;

    static std::vector<std::string> split(std::string_view topic);

private:
    std::string m_pattern;
    bool m_wildcard = false;

    // Lazily resolved from pattern_cache, atomic load/store.
    mutable std::shared_ptr<const compiled_pattern> m_matcher;
};

// Compiled wildcard patterns keyed by raw pattern string. Entries live for
// the lifetime of the process.
class pattern_cache {
public:
    static pattern_cache& instance();

    std::shared_ptr<const compiled_pattern> get(const std::string& pattern);

    std::size_t size() const;

private:
    pattern_cache() = default;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<const compiled_pattern>> m_compiled;
};

// One-off match without keeping a topic_pattern around.
bool matches(const std::string& pattern, std::string_view topic);

} // namespace shadowsync
