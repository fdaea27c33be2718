#pragma once

#include "config/config.pb.h"
#include "rnaflow/pipeline/v1/state.pb.h"

namespace rnaflow::pipeline::v1 {
using ::rnaflow::config::PipelineConfig;
}

namespace rnaflow {
inline constexpr const char* kVersion = "0.1.0";
}
