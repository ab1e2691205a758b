#pragma once

#include "usagestat/v1/usage.pb.h"

namespace usagestat::v1 {
using UsageStatList = google::protobuf::RepeatedPtrField<UsageStat>;
}
