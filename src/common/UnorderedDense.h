#pragma once

#include <ankerl/unordered_dense.h>

namespace tessel {
namespace unordered_dense = ankerl::unordered_dense;
} // namespace tessel
