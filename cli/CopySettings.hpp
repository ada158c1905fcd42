// Persistent defaults for copy batches (QSettings "OpenCopy"/"OpenCopy").
#pragma once
#include "opencopy/CopyTypes.hpp"

class QSettings;

namespace CopySettings {

// Reads Copy/*, Progress/* and Cleanup/* keys; missing or invalid values keep
// the built-in defaults.
opencopy::CopyOptions load(QSettings& s);

// Writes the tunables back (used by --save-defaults).
void store(QSettings& s, const opencopy::CopyOptions& opt);

} // namespace CopySettings
