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
#ifndef REP_LOOKUP_BOUNDARY_HPP_
#define REP_LOOKUP_BOUNDARY_HPP_

#include <stddef.h>           // for size_t
#include <nlohmann/json.hpp>  // for json
#include <string>             // for string
#include <vector>             // for vector
#include "geometry.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;

namespace boundary {

const char UNKNOWN_NAME[] = "Unknown";

// administrative boundary from geojson: name, shape, raw properties
struct BoundaryFeature {
    string name;
    geometry::Geometry geometry;
    json properties = json::object();
};

const vector<string>& nameKeyCandidates();
string detectName(const json& props);
string detectNumber(const json& props);

vector<BoundaryFeature> parseBoundaries(const json& gj, size_t* skipped);

const BoundaryFeature* locate(
    const vector<BoundaryFeature>& features, const geometry::Point& point,
    vector<string>* anomalies = nullptr);
vector<const BoundaryFeature*> locateAll(
    const vector<BoundaryFeature>& features, const geometry::Point& point,
    vector<string>* anomalies = nullptr);

vector<string> boundaryNames(const vector<BoundaryFeature>& features);
const BoundaryFeature* findBoundary(const vector<BoundaryFeature>& features, const string& name);
json featureCollectionJson(const BoundaryFeature& feature);

}  // namespace boundary

#endif  // REP_LOOKUP_BOUNDARY_HPP_
