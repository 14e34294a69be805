#pragma once

#include <cstdint>
#include <string>

namespace alo::db::model {

/*
  Subscriber row. Attributes are written by the ingestion pipeline; the
  campaign core only ever flips `active`.
*/
struct SubscriberRecord {
  std::string id;

  std::string endpoint;
  std::string credentials;

  std::string browser;
  std::string os;
  std::string device;
  std::string country;
  std::string language;
  uint64_t    last_seen_at_ms = 0;

  bool active = true;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace alo::db::model
