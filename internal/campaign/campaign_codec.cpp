#include "campaign_codec.hpp"

#include "internal/util/time.hpp"

namespace alo::campaign {

using alo::campaign::v1::Campaign;

Campaign ToProto(const db::model::CampaignRecord& r) {
  Campaign c;
  c.set_id(r.id);
  c.set_name(r.name);

  auto* content = c.mutable_content();
  content->set_title(r.title);
  content->set_body(r.body);
  content->set_url(r.url);
  content->set_image(r.image);
  content->set_icon(r.icon);
  content->set_badge(r.badge);
  content->set_require_interaction(r.require_interaction);
  content->set_renotify(r.renotify);
  content->set_silent(r.silent);

  for (const auto& filter : r.segments) {
    *c.add_segments() = filter;
  }

  if (r.send_at_ms != 0) *c.mutable_send_at() = util::MillisToProto(r.send_at_ms);
  c.set_status(r.status);
  c.set_version(r.version);

  if (r.created_at_ms != 0) *c.mutable_created_at() = util::MillisToProto(r.created_at_ms);
  if (r.updated_at_ms != 0) *c.mutable_updated_at() = util::MillisToProto(r.updated_at_ms);
  if (r.started_at_ms != 0) *c.mutable_started_at() = util::MillisToProto(r.started_at_ms);
  if (r.completed_at_ms != 0) *c.mutable_completed_at() = util::MillisToProto(r.completed_at_ms);

  auto* counters = c.mutable_counters();
  counters->set_audience_count(r.audience_count);
  counters->set_sent_count(r.sent_count);
  counters->set_failed_count(r.failed_count);

  c.set_failure_reason(r.failure_reason);
  return c;
}

void ApplyEditable(const Campaign& c, db::model::CampaignRecord& r) {
  r.name                = c.name();
  r.title               = c.content().title();
  r.body                = c.content().body();
  r.url                 = c.content().url();
  r.image               = c.content().image();
  r.icon                = c.content().icon();
  r.badge               = c.content().badge();
  r.require_interaction = c.content().require_interaction();
  r.renotify            = c.content().renotify();
  r.silent              = c.content().silent();
  r.segments.assign(c.segments().begin(), c.segments().end());
  r.send_at_ms = c.has_send_at() ? util::ProtoToMillis(c.send_at()) : 0;
}

alo::push::v1::PushMessage ToPushMessage(const db::model::CampaignRecord& r) {
  alo::push::v1::PushMessage m;
  m.set_campaign_id(r.id);
  m.set_title(r.title);
  m.set_body(r.body);
  m.set_url(r.url);
  m.set_image(r.image);
  m.set_icon(r.icon);
  m.set_badge(r.badge);
  m.set_require_interaction(r.require_interaction);
  m.set_renotify(r.renotify);
  m.set_silent(r.silent);
  // one notification per campaign on a device, renotify replaces it
  m.set_tag("campaign-" + r.id);
  return m;
}

} // namespace alo::campaign
