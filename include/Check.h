#pragma once

#include <ostream>
#include <string>

#include "Layout.h"

// Validates a loaded layout and prints the per-key table and the overlay
// summary. Returns the process exit code.
int runCheck(const std::string& configPath, const LayoutModel& layout, std::ostream& out);
