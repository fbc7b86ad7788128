#include "internal/strategy/model_resolver.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using relaynorm::runtime::config::RelayModelProfile;
using relaynorm::strategy::ModelResolver;

RelayModelProfile Profile(const std::string& name, std::vector<std::string> extensions, std::vector<std::string> signatures,
                          std::vector<std::string> filename_patterns) {
  RelayModelProfile profile;
  profile.set_name(name);
  for (const auto& e : extensions) profile.add_extensions(e);
  for (const auto& s : signatures) profile.add_content_signatures(s);
  for (const auto& f : filename_patterns) profile.add_filename_patterns(f);
  return profile;
}

struct Fixture {
  RelayModelProfile p3    = Profile("easergy_p3", {".pdf"}, {}, {"p3"});
  RelayModelProfile p3u   = Profile("easergy_p3u", {".pdf"}, {}, {"p3u30"});
  RelayModelProfile micom = Profile("micom_p14x", {".txt"}, {"MiCOM\\s+P14"}, {});
  RelayModelProfile notes = Profile("plain_notes", {".txt"}, {}, {});
  RelayModelProfile sepam = Profile("sepam_s40", {".s40"}, {"^\\[Identification\\]"}, {});

  ModelResolver Build() const {
    return ModelResolver({&p3, &p3u, &micom, &notes, &sepam});
  }
};

void TestContentSignatureWins() {
  Fixture    f;
  const auto resolver = f.Build();

  // two .txt profiles, the signature singles one out
  assert(resolver.Resolve("feeder.txt", ".txt", "MiCOM  P143 Settings").name() == "micom_p14x");

  // content beats a misleading extension
  assert(resolver.Resolve("TR-204.txt", ".txt", "[Identification]\nrepere=TR-204").name() == "sepam_s40");
}

void TestExtensionWhenUnique() {
  Fixture    f;
  const auto resolver = f.Build();
  assert(resolver.Resolve("TR-204.S40", ".S40", "").name() == "sepam_s40");
  assert(resolver.KnowsExtension(".TXT"));
  assert(!resolver.KnowsExtension(".png"));
}

void TestLongestFilenamePatternDecides() {
  Fixture    f;
  const auto resolver = f.Build();
  assert(resolver.Resolve("P3U30_feeder_12.pdf", ".pdf", "").name() == "easergy_p3u");
  assert(resolver.Resolve("P3F30_feeder_12.pdf", ".pdf", "").name() == "easergy_p3");
}

void TestAmbiguityIsUnknownModel() {
  Fixture    f;
  const auto resolver = f.Build();

  bool threw = false;
  try {
    (void)resolver.Resolve("notes.txt", ".txt", "nothing recognisable");
  } catch (const relaynorm::util::UnknownModel&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)resolver.Resolve("scan.png", ".png", "");
  } catch (const relaynorm::util::UnknownModel&) {
    threw = true;
  }
  assert(threw);

  // same pattern length in two profiles
  RelayModelProfile a = Profile("a", {".pdf"}, {}, {"abc"});
  RelayModelProfile b = Profile("b", {".pdf"}, {}, {"xyz"});
  ModelResolver     tied({&a, &b});
  threw = false;
  try {
    (void)tied.Resolve("abc_xyz.pdf", ".pdf", "");
  } catch (const relaynorm::util::UnknownModel&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidPatternIsConfigError() {
  RelayModelProfile bad = Profile("bad", {".txt"}, {"(unclosed"}, {});
  bool              threw = false;
  try {
    ModelResolver resolver({&bad});
  } catch (const relaynorm::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestContentSignatureWins();
  TestExtensionWhenUnique();
  TestLongestFilenamePatternDecides();
  TestAmbiguityIsUnknownModel();
  TestInvalidPatternIsConfigError();

  std::cout << "relaynorm_unit_model_resolver: pass\n";
  return 0;
}
