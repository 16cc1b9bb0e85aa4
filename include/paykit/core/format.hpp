#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

namespace paykit::compat {
    using fmt::format;
}
