#pragma once

#include <fmt/core.h>

namespace sessionseal::compat {
    using fmt::format;
}
