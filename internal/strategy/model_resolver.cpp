#include "model_resolver.hpp"

#include <cstdint>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::strategy {

namespace {

using observability::IntField;
using observability::StringField;
using relaynorm::runtime::config::RelayModelProfile;

std::regex Compile(const std::string& pattern, const std::string& profile, const char* what) {
  try {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error& e) {
    throw util::InvalidConfig("profile '" + profile + "': invalid " + what + " '" + pattern + "': " + e.what());
  }
}

std::string Names(const std::vector<const RelayModelProfile*>& profiles) {
  std::vector<std::string> names;
  for (const auto* p : profiles) names.push_back(p->name());
  return util::Join(names, ", ");
}

} // namespace

ModelResolver::ModelResolver(const std::vector<const RelayModelProfile*>& profiles) {
  candidates_.reserve(profiles.size());
  for (const auto* profile : profiles) {
    Candidate c;
    c.profile = profile;
    for (const auto& s : profile->content_signatures()) {
      c.signatures.push_back(Compile(s, profile->name(), "content signature"));
    }
    for (const auto& f : profile->filename_patterns()) {
      c.filename_patterns.emplace_back(Compile(f, profile->name(), "filename pattern"), f.size());
    }
    candidates_.push_back(std::move(c));
  }
}

bool ModelResolver::KnowsExtension(const std::string& extension) const {
  for (const auto& c : candidates_) {
    for (const auto& ext : c.profile->extensions()) {
      if (util::EqualsFolded(ext, extension)) return true;
    }
  }
  return false;
}

const RelayModelProfile& ModelResolver::Resolve(const std::string& file_name,
                                                const std::string& extension,
                                                const std::string& content_sample) const {
  std::vector<const Candidate*> by_content;
  std::vector<const Candidate*> by_extension;

  for (const auto& c : candidates_) {
    for (const auto& signature : c.signatures) {
      if (std::regex_search(content_sample, signature)) {
        by_content.push_back(&c);
        break;
      }
    }
    for (const auto& ext : c.profile->extensions()) {
      if (util::EqualsFolded(ext, extension)) {
        by_extension.push_back(&c);
        break;
      }
    }
  }

  if (by_content.size() == 1) return *by_content.front()->profile;

  const auto& pool = by_content.empty() ? by_extension : by_content;
  if (pool.empty()) {
    throw util::UnknownModel("no profile matches '" + file_name + "' by content or extension");
  }
  if (pool.size() == 1) return *pool.front()->profile;

  // several candidates: the most specific filename pattern decides
  const Candidate* best        = nullptr;
  std::size_t      best_length = 0;
  bool             tie         = false;
  for (const auto* c : pool) {
    for (const auto& [pattern, length] : c->filename_patterns) {
      if (!std::regex_search(file_name, pattern)) continue;
      if (best == nullptr || length > best_length) {
        best        = c;
        best_length = length;
        tie         = false;
      } else if (length == best_length && best != c) {
        tie = true;
      }
    }
  }

  std::vector<const RelayModelProfile*> names;
  for (const auto* c : pool) names.push_back(c->profile);

  if (best == nullptr || tie) {
    RELAYNORM_LOG_WARN("Ambiguous relay model",
                       {StringField("file", file_name), IntField("candidates", static_cast<std::int64_t>(pool.size())), StringField("profiles", Names(names))});
    throw util::UnknownModel("'" + file_name + "' matches several profiles (" + Names(names) + ")");
  }

  RELAYNORM_LOG_DEBUG("Relay model chosen by filename", {StringField("file", file_name), StringField("profile", best->profile->name())});
  return *best->profile;
}

} // namespace relaynorm::strategy
