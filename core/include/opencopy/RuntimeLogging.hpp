// Which diagnostic categories the environment turns on.
//
//   OPEN_COPY_ENV=dev|debug          every category
//   OPEN_COPY_LOG_DEBUG=1|all|*      every category
//   OPEN_COPY_LOG_DEBUG=copy,cli     only the listed ones ("opencopy.copy"
//                                    is accepted as well as "copy")
#pragma once

#include <string>
#include <vector>

namespace opencopy {

struct DebugLogging {
    bool all = false;
    std::vector<std::string> categories;  // short names, e.g. "copy"

    bool enabled() const { return all || !categories.empty(); }
    bool enabledFor(const std::string &category) const;

    // QLoggingCategory::setFilterRules text: one "opencopy.<name>.debug=true"
    // line per selected category, or "opencopy.*.debug=true". Empty when
    // nothing is selected.
    std::string filterRules() const;
};

// Parses the two variables above. Unknown words are kept as category names;
// "0", "false", "no" and "off" select nothing.
DebugLogging debugLoggingFromEnv();

// Same, from explicit values (null means unset).
DebugLogging parseDebugLogging(const char *envName, const char *logDebug);

} // namespace opencopy
