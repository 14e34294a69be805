#include "campaign_validation.hpp"

#include "internal/util/errors.hpp"

namespace alo::campaign {

namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() > prefix.size() && text.substr(0, prefix.size()) == prefix;
}

bool IsHttpsUrl(std::string_view url) {
  return StartsWith(url, "https://");
}

bool IsHttpUrl(std::string_view url) {
  return StartsWith(url, "http://") || IsHttpsUrl(url);
}

void CheckMedia(std::vector<std::string>& problems, std::string_view field, const std::string& value) {
  if (!value.empty() && !IsHttpsUrl(value)) {
    problems.push_back(std::string(field) + " must be an https URL");
  }
}

} // namespace

std::size_t Utf8Length(std::string_view text) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < text.size();) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t width = 1;
    if (lead >= 0xF0 && lead < 0xF8) {
      width = 4;
    } else if (lead >= 0xE0) {
      width = 3;
    } else if (lead >= 0xC0) {
      width = 2;
    }
    if (lead >= 0xF8 || i + width > text.size()) width = 1;
    i += width;
    ++count;
  }
  return count;
}

std::vector<std::string> ValidateContent(const db::model::CampaignRecord& r) {
  std::vector<std::string> problems;

  if (r.title.empty()) {
    problems.emplace_back("title is required");
  } else if (Utf8Length(r.title) > kMaxTitleChars) {
    problems.push_back("title exceeds " + std::to_string(kMaxTitleChars) + " characters");
  }

  if (r.body.empty()) {
    problems.emplace_back("body is required");
  } else if (Utf8Length(r.body) > kMaxBodyChars) {
    problems.push_back("body exceeds " + std::to_string(kMaxBodyChars) + " characters");
  }

  if (!r.url.empty() && !IsHttpUrl(r.url)) {
    problems.emplace_back("url must be an http or https URL");
  }

  CheckMedia(problems, "image", r.image);
  CheckMedia(problems, "icon", r.icon);
  CheckMedia(problems, "badge", r.badge);

  return problems;
}

std::vector<alo::campaign::v1::SegmentFilter> ValidateCampaign(const db::model::CampaignRecord& record, const segment::SegmentCatalog& catalog,
                                                               segment::DuplicateTypePolicy policy) {
  const auto problems = ValidateContent(record);
  if (!problems.empty()) {
    std::string message = "invalid campaign content: ";
    for (std::size_t i = 0; i < problems.size(); ++i) {
      if (i > 0) message += "; ";
      message += problems[i];
    }
    throw util::InvalidArgument(message);
  }

  for (const auto& filter : record.segments) {
    catalog.Require(filter.type());
  }

  return segment::NormalizeFilters(record.segments, policy);
}

} // namespace alo::campaign
