#ifndef __PT_JSON_LIB__
#define __PT_JSON_LIB__

#include "nlohmann/json.hpp"

namespace pt {
// Status dumps and layout tokens.
using json = nlohmann::json;
}  // namespace pt

#endif  // __PT_JSON_LIB__
