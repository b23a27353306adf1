#pragma once

#include <cstdint>

namespace fl::types {

using FolderId = int32_t;
using AccountId = int64_t;
using EntityId = int64_t;

}
