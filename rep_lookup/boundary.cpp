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
#include "boundary.hpp"
#include <algorithm>             // for find_if, sort
#include <cstddef>               // for size_t
#include <iostream>              // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>     // for basic_json
#include <sstream>               // for basic_ostringstream
#include <stdexcept>             // for runtime_error
#include <string>                // for basic_string, string
#include <utility>               // for move
#include <vector>                // for vector
#include "geometry.hpp"
#include "names.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::move;
using std::runtime_error;
using std::ostringstream;
using json = nlohmann::json;

using geometry::Point;
using geometry::MalformedFeature;
using geometry::UnsupportedGeometry;

namespace boundary {
    // Property keys that may carry the boundary name, in priority order
    const vector<string>& nameKeyCandidates() {
        static const vector<string> candidates = {
            "AC_NAME", "AC_Name", "ac_name",
            "NAME", "Name", "name"
        };
        return candidates;
    }

    // Pulls the boundary name out of a feature's properties
    //
    // Args:
    //     props: json object of properties
    // Returns:
    //     first present, non-empty string value among nameKeyCandidates(),
    //         or "Unknown"
    string detectName(const json& props) {
        if (!props.is_object()) return UNKNOWN_NAME;
        const auto& candidates = nameKeyCandidates();
        auto it = std::find_if(
            candidates.begin(),
            candidates.end(),
            [&](const auto& k) {
                return props.contains(k) && props[k].is_string() &&
                    !names::trim(props[k].template get<string>()).empty();
            });
        if (it == candidates.end()) return UNKNOWN_NAME;
        return names::trim(props[*it].get<string>());
    }

    // Pulls the boundary's official number out of its properties
    //
    // Args:
    //     props: json object of properties
    // Returns:
    //     number as a string, or empty when the feature has none
    string detectNumber(const json& props) {
        if (!props.is_object()) return {};
        static const vector<string> candidates = { "AC_Code", "AC_NO", "AC_NUM" };
        for (const auto& k : candidates) {
            if (!props.contains(k)) continue;
            const auto& v = props[k];
            if (v.is_string() && !v.get<string>().empty()) return v.get<string>();
            if (v.is_number_integer()) return std::to_string(v.get<long long>());
            if (v.is_number()) return v.dump();
        }
        return {};
    }

    // Builds boundary features from a parsed geojson FeatureCollection.
    // Dataset order is kept; it decides which boundary wins on overlap.
    //
    // Args:
    //    gj: the FeatureCollection
    //    skipped: number of features dropped for a non-area type or an invalid
    //        shape, set here
    // Returns:
    //    the boundary features with valid Polygon or MultiPolygon geometry
    vector<BoundaryFeature> parseBoundaries(const json& gj, size_t* skipped) {
        if (!gj.is_object() || !gj.contains("features") || !gj["features"].is_array())
            throw runtime_error("Invalid GeoJSON (no features array)");

        vector<BoundaryFeature> features;
        size_t dropped = 0;
        size_t index = 0;
        for (const auto& feat : gj["features"]) {
            const size_t i = index++;
            if (!feat.is_object() || !feat.contains("geometry") || feat["geometry"].is_null()) continue;

            BoundaryFeature feature;
            if (feat.contains("properties") && feat["properties"].is_object())
                feature.properties = feat["properties"];
            feature.name = detectName(feature.properties);

            try {
                feature.geometry = geometry::parseGeometry(feat["geometry"]);
                geometry::validateGeometry(feature.geometry);
            } catch (const UnsupportedGeometry& e) {
                cerr << "[warn] Ignoring non-area feature " << i << " ('" << feature.name << "'): "
                     << e.what() << "\n";
                ++dropped;
                continue;
            } catch (const MalformedFeature& e) {
                cerr << "[warn] Dropping malformed feature " << i << " ('" << feature.name << "'): "
                     << e.what() << "\n";
                ++dropped;
                continue;
            } catch (const json::exception& e) {
                cerr << "[warn] Dropping malformed feature " << i << " ('" << feature.name << "'): "
                     << e.what() << "\n";
                ++dropped;
                continue;
            }
            features.push_back(move(feature));
        }

        if (skipped) *skipped = dropped;
        return features;
    }

    // Scans features in order, testing each structurally valid one.
    // Malformed features are logged, recorded and treated as non-matching;
    // UnsupportedGeometry propagates to the caller.
    //
    // Args:
    //     features: the boundary dataset
    //     point: lon/lat to locate
    //     firstOnly: stop at the first match
    //     anomalies: optional list that receives one line per skipped feature
    // Returns:
    //     matching features in dataset order
    static vector<const BoundaryFeature*> scan(
        const vector<BoundaryFeature>& features, const Point& point,
        bool firstOnly, vector<string>* anomalies) {
        vector<const BoundaryFeature*> matches;
        for (size_t i = 0; i < features.size(); ++i) {
            const auto& feature = features[i];
            try {
                geometry::validateGeometry(feature.geometry);
            } catch (const MalformedFeature& e) {
                ostringstream oss;
                oss << "feature " << i << " ('" << feature.name << "'): " << e.what();
                cerr << "[warn] Skipping malformed boundary " << oss.str() << "\n";
                if (anomalies) anomalies->push_back(oss.str());
                continue;
            }
            if (!geometry::pointInGeometry(feature.geometry, point)) continue;
            matches.push_back(&feature);
            if (firstOnly) break;
        }
        return matches;
    }

    // First boundary in dataset order containing the point
    //
    // Returns:
    //     the matching feature, or nullptr when the point is outside all boundaries
    const BoundaryFeature* locate(
        const vector<BoundaryFeature>& features, const Point& point,
        vector<string>* anomalies) {
        const auto matches = scan(features, point, true, anomalies);
        return matches.empty() ? nullptr : matches.front();
    }

    // Every boundary containing the point, in dataset order
    vector<const BoundaryFeature*> locateAll(
        const vector<BoundaryFeature>& features, const Point& point,
        vector<string>* anomalies) {
        return scan(features, point, false, anomalies);
    }

    // Sorted names of all loaded boundaries
    vector<string> boundaryNames(const vector<BoundaryFeature>& features) {
        vector<string> out;
        out.reserve(features.size());
        for (const auto& feature : features) out.push_back(feature.name);
        std::sort(out.begin(), out.end());
        return out;
    }

    // Case-insensitive exact name match
    //
    // Returns:
    //     first feature with that name, or nullptr
    const BoundaryFeature* findBoundary(const vector<BoundaryFeature>& features, const string& name) {
        const string wanted = names::trim(name);
        auto it = std::find_if(
            features.begin(),
            features.end(),
            [&](const auto& feature) {
                return names::equalsIgnoreCase(feature.name, wanted);
            });
        return it == features.end() ? nullptr : &*it;
    }

    // Wraps one feature into a geojson FeatureCollection
    json featureCollectionJson(const BoundaryFeature& feature) {
        json feat = {
            {"type", "Feature"},
            {"properties", feature.properties},
            {"geometry", geometry::geometryToJson(feature.geometry)}
        };
        return json{{"type", "FeatureCollection"}, {"features", json::array({feat})}};
    }
}  // namespace boundary
