#pragma once

#include "api/issueflow/v1/flow.pb.h"

namespace issueflow::api {
using namespace ::issueflow::v1;
}
