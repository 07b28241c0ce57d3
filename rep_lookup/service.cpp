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
#include "service.hpp"
#include <cmath>                 // for isfinite
#include <iostream>              // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>     // for basic_json
#include <sstream>               // for basic_ostringstream
#include <stdexcept>             // for invalid_argument
#include <string>                // for basic_string, string
#include <vector>                // for vector

using std::string;
using std::vector;
using std::cerr;
using std::isfinite;
using std::invalid_argument;
using std::ostringstream;
using json = nlohmann::json;

using boundary::BoundaryFeature;
using geometry::Point;
using metadata::MatchTier;
using metadata::MetadataRecord;

namespace service {
    // Rejects coordinates that can't be looked up
    //
    // Args:
    //    lat: latitude
    //    lon: longitude
    //    area: optional window the service is limited to
    // Throws:
    //    invalid_argument for non-finite, out-of-range or out-of-area values
    void validateCoordinate(double lat, double lon, const optional<ServiceArea>& area) {
        if (!isfinite(lat) || !isfinite(lon))
            throw invalid_argument("Latitude and longitude must be finite numbers");
        if (lat < -90.0 || lat > 90.0) throw invalid_argument("Latitude must be within [-90, 90]");
        if (lon < -180.0 || lon > 180.0) throw invalid_argument("Longitude must be within [-180, 180]");
        if (area && (lat < area->minLat || lat > area->maxLat ||
                     lon < area->minLon || lon > area->maxLon)) {
            ostringstream oss;
            oss << "Coordinate (" << lat << ", " << lon << ") is outside the service area ["
                << area->minLat << ", " << area->maxLat << "] x ["
                << area->minLon << ", " << area->maxLon << "]";
            throw invalid_argument(oss.str());
        }
    }

    LookupService::LookupService(const store::DataStore& data, ResultCache* cache, std::chrono::seconds ttl)
        : data_(data), cache_(cache), ttl_(ttl) {}

    // Representatives for a coordinate, served from the cache while fresh
    //
    // Args:
    //    lat: latitude
    //    lon: longitude
    // Returns:
    //    boundary and region records; both empty when no boundary contains the point
    // Throws:
    //    geometry::UnsupportedGeometry when the dataset holds a non-area geometry
    LookupResult LookupService::resolvePoint(double lat, double lon) {
        if (!cache_) return compute(lat, lon);
        return cache_->getOrCompute(cache::cacheKey(lat, lon), ttl_, [&] {
            return compute(lat, lon);
        });
    }

    LookupResult LookupService::compute(double lat, double lon) const {
        // geojson positions are (lon, lat)
        const Point point{lon, lat};
        const BoundaryFeature* feature = boundary::locate(data_.boundaries, point);
        LookupResult result;
        if (!feature) {
            cerr << "[warn] No boundary found for (" << lat << ", " << lon << ")\n";
            return result;
        }
        result.boundaryMatch = boundaryRecord(*feature);
        result.regionMatch = regionRecord(*feature);
        return result;
    }

    // Record for the matched boundary. The feature's own number fills in
    // when the record has none.
    MetadataRecord LookupService::boundaryRecord(const BoundaryFeature& feature) const {
        auto resolution = metadata::resolveWithTier(feature.name, data_.boundaryRecords);
        MetadataRecord record = resolution.record;
        if (resolution.tier != MatchTier::Placeholder) record.constituency = feature.name;
        if (resolution.tier == MatchTier::Placeholder) {
            cerr << "[warn] No record for boundary '" << feature.name << "'\n";
        }
        if (!record.constituencyNumber) {
            const string number = boundary::detectNumber(feature.properties);
            if (!number.empty()) record.constituencyNumber = number;
        }
        return record;
    }

    // Record for the region holding the matched boundary; unmapped
    // boundaries get a placeholder named "Unknown"
    MetadataRecord LookupService::regionRecord(const BoundaryFeature& feature) const {
        const auto regionName = data_.regionTable.mapToRegion(feature.name);
        if (!regionName) {
            cerr << "[warn] No region mapping for boundary '" << feature.name << "'\n";
            return metadata::placeholderRecord(boundary::UNKNOWN_NAME);
        }
        auto resolution = metadata::resolveWithTier(*regionName, data_.regionRecords);
        MetadataRecord record = resolution.record;
        if (resolution.tier != MatchTier::Placeholder) record.constituency = *regionName;
        if (resolution.tier == MatchTier::Placeholder) {
            cerr << "[warn] No record for region '" << *regionName << "'\n";
        }
        return record;
    }

    vector<string> LookupService::listKnownBoundaries() const {
        return boundary::boundaryNames(data_.boundaries);
    }

    // Region record names, sorted
    vector<string> LookupService::listKnownRegions() const {
        vector<string> out;
        out.reserve(data_.regionRecords.size());
        for (const auto& kv : data_.regionRecords) out.push_back(kv.first);
        return out;
    }

    // Case-insensitive exact name match
    //
    // Returns:
    //    the boundary's geometry, or nullptr when no boundary has that name
    const geometry::Geometry* LookupService::getBoundaryGeometry(const string& name) const {
        const BoundaryFeature* feature = getBoundaryFeature(name);
        return feature ? &feature->geometry : nullptr;
    }

    const BoundaryFeature* LookupService::getBoundaryFeature(const string& name) const {
        return boundary::findBoundary(data_.boundaries, name);
    }

    Health LookupService::health() const {
        Health h;
        h.boundaries = data_.boundaries.size();
        h.boundaryRecords = data_.boundaryRecords.size();
        h.regionRecords = data_.regionRecords.size();
        h.regionMappings = data_.regionTable.size();
        h.skippedFeatures = data_.skippedFeatures;
        h.cacheEntries = cache_ ? cache_->size() : 0;
        return h;
    }

    json lookupToJson(double lat, double lon, const LookupResult& result) {
        json j = {{"latitude", lat}, {"longitude", lon}};
        j["mla"] = result.boundaryMatch ? metadata::recordToJson(*result.boundaryMatch) : json(nullptr);
        j["mp"] = result.regionMatch ? metadata::recordToJson(*result.regionMatch) : json(nullptr);
        return j;
    }

    json listingToJson(const vector<string>& boundaries, const vector<string>& regions) {
        return json{
            {"assembly_constituencies", boundaries},
            {"parliamentary_constituencies", regions}
        };
    }

    json healthToJson(const Health& health) {
        return json{
            {"status", "ok"},
            {"boundaries_loaded", health.boundaries},
            {"boundary_records_loaded", health.boundaryRecords},
            {"region_records_loaded", health.regionRecords},
            {"region_mappings", health.regionMappings},
            {"skipped_features", health.skippedFeatures},
            {"cache_entries", health.cacheEntries}
        };
    }
}  // namespace service
