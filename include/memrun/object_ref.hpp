#pragma once

#include <string>

namespace memrun {

struct ObjectRef {
    std::string bucket;
    std::string key;
};

} // namespace memrun
