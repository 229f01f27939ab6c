#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace flowsched::scheduler {

// Converts a failed db::Result into the matching util exception.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace flowsched::scheduler
