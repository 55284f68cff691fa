#pragma once

#include <string>
#include "pulselink_core.h"

namespace pulselink {

// Returns false if options are invalid for sample rate fs. On failure, sets
// err_code (stable code) and err_msg (short reason). On success both are
// untouched. Validation only; no clamping.
bool validateOptions(double fs,
                     const Options& opt,
                     const char** err_code,
                     std::string* err_msg);

// Applies one "name=value" override (e.g. "beatHighHz=6"). Returns false for
// an unknown name or an unparsable value; opt is unchanged in that case.
bool applyOptionOverride(Options& opt, const std::string& assignment);

} // namespace pulselink
