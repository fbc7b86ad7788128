#pragma once

#include <regex>
#include <string>
#include <vector>

namespace relaynorm::runtime::config {
class RelayModelProfile;
}

namespace relaynorm::strategy {

/*
  ModelResolver

  Maps a document to exactly one relay-model profile.

  Order of evidence:
    1. content signatures over the sniffed text
    2. file extension
    3. filename patterns, only to choose among 1/2 candidates

  Anything short of a single profile throws util::UnknownModel.
*/
class ModelResolver {
 public:
  explicit ModelResolver(const std::vector<const relaynorm::runtime::config::RelayModelProfile*>& profiles);

  const relaynorm::runtime::config::RelayModelProfile& Resolve(const std::string& file_name,
                                                               const std::string& extension,
                                                               const std::string& content_sample) const;

  // true when some profile claims the extension
  bool KnowsExtension(const std::string& extension) const;

 private:
  struct Candidate {
    const relaynorm::runtime::config::RelayModelProfile* profile = nullptr;
    std::vector<std::regex>                               signatures;
    std::vector<std::pair<std::regex, std::size_t>>       filename_patterns; // pattern, source length
  };

  std::vector<Candidate> candidates_;
};

} // namespace relaynorm::strategy
