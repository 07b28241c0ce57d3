// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef REP_LOOKUP_SERVICE_HPP_
#define REP_LOOKUP_SERVICE_HPP_

#include <stddef.h>               // for size_t
#include <chrono>                 // for seconds
#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <string>                 // for string
#include <vector>                 // for vector
#include "boundary.hpp"
#include "cache.hpp"
#include "geometry.hpp"
#include "metadata.hpp"
#include "store.hpp"

using std::string;
using std::vector;
using std::optional;
using json = nlohmann::json;

namespace service {

// representatives for one coordinate
struct LookupResult {
    // empty iff the point is outside every known boundary
    optional<metadata::MetadataRecord> boundaryMatch;
    // present whenever boundaryMatch is
    optional<metadata::MetadataRecord> regionMatch;
};

using ResultCache = cache::TtlCache<LookupResult>;

// inclusive lat/lon window the service answers for
struct ServiceArea {
    double minLat{}, maxLat{}, minLon{}, maxLon{};
};

struct Health {
    size_t boundaries{};
    size_t boundaryRecords{};
    size_t regionRecords{};
    size_t regionMappings{};
    size_t skippedFeatures{};
    size_t cacheEntries{};
};

void validateCoordinate(double lat, double lon, const optional<ServiceArea>& area);

// Resolution entry point. Reads an immutable DataStore; the cache is the
// only state it writes, and may be null to disable caching.
class LookupService {
 public:
    LookupService(const store::DataStore& data, ResultCache* cache, std::chrono::seconds ttl);

    LookupResult resolvePoint(double lat, double lon);
    vector<string> listKnownBoundaries() const;
    vector<string> listKnownRegions() const;
    const geometry::Geometry* getBoundaryGeometry(const string& name) const;
    const boundary::BoundaryFeature* getBoundaryFeature(const string& name) const;
    Health health() const;

 private:
    LookupResult compute(double lat, double lon) const;
    metadata::MetadataRecord boundaryRecord(const boundary::BoundaryFeature& feature) const;
    metadata::MetadataRecord regionRecord(const boundary::BoundaryFeature& feature) const;

    const store::DataStore& data_;
    ResultCache* cache_;
    std::chrono::seconds ttl_;
};

json lookupToJson(double lat, double lon, const LookupResult& result);
json listingToJson(const vector<string>& boundaries, const vector<string>& regions);
json healthToJson(const Health& health);

}  // namespace service

#endif  // REP_LOOKUP_SERVICE_HPP_
