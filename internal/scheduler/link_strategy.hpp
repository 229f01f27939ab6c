#pragma once

#include <string_view>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace flowsched::scheduler {

/*
  Picks how RunMaterializer links new states to their runs.

  AUTO:
    "postgresql", "memory" -> update-join
    "sqlite"               -> correlated subquery
    anything else          -> util::ConfigurationError

  An explicit configured strategy wins over the dialect.
*/
db::StateLinkStrategy ResolveLinkStrategy(std::string_view dialect, flowsched::runtime::config::StateLinkStrategy configured);

std::string_view ToString(db::StateLinkStrategy strategy);

} // namespace flowsched::scheduler
