#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

namespace tessera::compat {
    using fmt::format;
}
