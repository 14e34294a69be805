#pragma once

#include "alo/campaign/v1/types.pb.h"

#include "alo/campaign/v1/admin_service.pb.h"
#include "alo/campaign/v1/campaign_service.pb.h"
#include "alo/campaign/v1/segment_service.pb.h"

#include "alo/push/v1/push_gateway.pb.h"

namespace alo::campaign::v1 {
using ::alo::push::v1::PushMessage;
}
