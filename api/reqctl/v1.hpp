#pragma once

#include "reqctl/core/v1/rule.pb.h"
#include "reqctl/core/v1/options.pb.h"

namespace reqctl::v1 {
using namespace ::reqctl::core::v1;
}
