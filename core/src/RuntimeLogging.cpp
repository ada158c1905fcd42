#include "opencopy/RuntimeLogging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace opencopy {

namespace {

const std::string kPrefix = "opencopy.";

std::string lowered(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Splits on commas and blanks.
std::vector<std::string> words(const char *value) {
    std::vector<std::string> out;
    if (!value)
        return out;
    std::string cur;
    for (const char *p = value;; ++p) {
        const unsigned char c = static_cast<unsigned char>(*p);
        if (c == '\0' || c == ',' || std::isspace(c)) {
            if (!cur.empty())
                out.push_back(lowered(cur));
            cur.clear();
            if (c == '\0')
                break;
            continue;
        }
        cur += static_cast<char>(c);
    }
    return out;
}

} // namespace

bool DebugLogging::enabledFor(const std::string &category) const {
    return all || std::find(categories.begin(), categories.end(),
                            category) != categories.end();
}

std::string DebugLogging::filterRules() const {
    if (all)
        return kPrefix + "*.debug=true";
    std::string rules;
    for (const std::string &c : categories) {
        if (!rules.empty())
            rules += '\n';
        rules += kPrefix + c + ".debug=true";
    }
    return rules;
}

DebugLogging parseDebugLogging(const char *envName, const char *logDebug) {
    DebugLogging d;
    for (const std::string &w : words(envName)) {
        if (w == "dev" || w == "development" || w == "local" || w == "debug")
            d.all = true;
    }
    for (std::string w : words(logDebug)) {
        if (w == "0" || w == "false" || w == "no" || w == "off")
            continue;
        if (w == "1" || w == "true" || w == "yes" || w == "on" ||
            w == "all" || w == "*") {
            d.all = true;
            continue;
        }
        if (w.compare(0, kPrefix.size(), kPrefix) == 0)
            w.erase(0, kPrefix.size());
        if (!w.empty() && !d.enabledFor(w))
            d.categories.push_back(w);
    }
    if (d.all)
        d.categories.clear();
    return d;
}

DebugLogging debugLoggingFromEnv() {
    return parseDebugLogging(std::getenv("OPEN_COPY_ENV"),
                             std::getenv("OPEN_COPY_LOG_DEBUG"));
}

} // namespace opencopy
