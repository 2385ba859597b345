#include "topic_pattern.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>

namespace shadowsync {

namespace {

bool is_wildcard_char(char c) {
    return c == '*' || c == '#';
}

void validate(const std::vector<std::string>& segments, const std::string& pattern) {
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        bool has_wild = seg.find_first_of("*#") != std::string::npos;
        if (!has_wild) continue;

        if (seg != "*" && seg != "#") {
            throw invalid_pattern_error(
                "wildcard must occupy a whole segment: '" + pattern + "'");
        }
        if (seg == "#" && i + 1 != segments.size()) {
            throw invalid_pattern_error(
                "'#' is only valid as the final segment: '" + pattern + "'");
        }
    }
}

} // anonymous namespace

topic_pattern::topic_pattern(std::string pattern)
    : m_pattern(std::move(pattern))
{
    m_wildcard = std::find_if(m_pattern.begin(), m_pattern.end(), is_wildcard_char)
                 != m_pattern.end();
    if (m_wildcard) {
        validate(split(m_pattern), m_pattern);
    }
}

std::vector<std::string> topic_pattern::split(std::string_view topic) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        auto dot = topic.find('.', start);
        if (dot == std::string_view::npos) {
            out.emplace_back(topic.substr(start));
            break;
        }
        out.emplace_back(topic.substr(start, dot - start));
        start = dot + 1;
    }
    return out;
}

compiled_pattern compiled_pattern::compile(std::string_view pattern) {
    compiled_pattern out;
    if (pattern == "#") {
        out.trailing_hash = true;
        return out;
    }
    for (auto& seg : topic_pattern::split(pattern)) {
        if (seg == "#") {
            out.trailing_hash = true;
        } else if (seg == "*") {
            out.segments.push_back({true, {}});
        } else {
            out.segments.push_back({false, std::move(seg)});
        }
    }
    return out;
}

bool compiled_pattern::matches(std::string_view topic) const {
    // '#' alone matches every topic, including empty segments.
    if (segments.empty() && trailing_hash) return true;

    // pos == npos once the topic is fully consumed.
    std::size_t pos = 0;
    for (const auto& seg : segments) {
        if (pos == std::string_view::npos) return false;

        auto dot = topic.find('.', pos);
        auto part = topic.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
        if (seg.any ? part.empty() : part != seg.literal) return false;

        pos = dot == std::string_view::npos ? std::string_view::npos : dot + 1;
    }

    if (pos == std::string_view::npos) return true;
    if (!trailing_hash) return false;

    // Each segment absorbed by a trailing '#' must be non-empty.
    auto rest = topic.substr(pos);
    return !rest.empty() && rest.back() != '.' && rest.find("..") == std::string_view::npos;
}

std::string topic_pattern::literal_prefix() const {
    std::string prefix;
    for (const auto& seg : split(m_pattern)) {
        if (seg == "*" || seg == "#") break;
        if (!prefix.empty()) prefix += '.';
        prefix += seg;
    }
    return prefix;
}

bool topic_pattern::matches(std::string_view topic) const {
    if (!m_wildcard) {
        return topic == m_pattern;
    }

    auto matcher = std::atomic_load(&m_matcher);
    if (!matcher) {
        matcher = pattern_cache::instance().get(m_pattern);
        std::atomic_store(&m_matcher, matcher);
    }
    return matcher->matches(topic);
}

pattern_cache& pattern_cache::instance() {
    static pattern_cache cache;
    return cache;
}

std::shared_ptr<const compiled_pattern> pattern_cache::get(const std::string& pattern) {
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_compiled.find(pattern);
        if (it != m_compiled.end()) return it->second;
    }

    // Compile outside the lock; a racing compile of the same pattern is harmless.
    auto compiled = std::make_shared<const compiled_pattern>(compiled_pattern::compile(pattern));

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_compiled.emplace(pattern, std::move(compiled)).first->second;
}

std::size_t pattern_cache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_compiled.size();
}

bool matches(const std::string& pattern, std::string_view topic) {
    return topic_pattern(pattern).matches(topic);
}

} // namespace shadowsync
