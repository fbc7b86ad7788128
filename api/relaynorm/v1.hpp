#pragma once

#include "relaynorm/v1/page_bundle.pb.h"
#include "relaynorm/v1/report.pb.h"

#include "config/config.pb.h"

namespace relaynorm::v1 {
namespace config = ::relaynorm::runtime::config;
}
