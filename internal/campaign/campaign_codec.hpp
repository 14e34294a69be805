#pragma once

#include "alo/campaign/v1/types.pb.h"
#include "alo/push/v1/push_gateway.pb.h"
#include "internal/db/model/campaign_record.hpp"

namespace alo::campaign {

alo::campaign::v1::Campaign ToProto(const db::model::CampaignRecord& record);

// Copies the caller-editable fields (name, content, segments, send_at).
void ApplyEditable(const alo::campaign::v1::Campaign& campaign, db::model::CampaignRecord& record);

alo::push::v1::PushMessage ToPushMessage(const db::model::CampaignRecord& record);

} // namespace alo::campaign
