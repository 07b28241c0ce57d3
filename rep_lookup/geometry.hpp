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
#ifndef REP_LOOKUP_GEOMETRY_HPP_
#define REP_LOOKUP_GEOMETRY_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <stdexcept>              // for runtime_error
#include <string>                 // for string, basic_string
#include <vector>                 // for vector

using std::string;
using std::vector;
using json = nlohmann::json;

namespace geometry {

const char POLYGON[] = "Polygon";
const char MULTI_POLYGON[] = "MultiPolygon";

// --------------------------------------
// structures for holding boundary shapes
// --------------------------------------

// lon/lat point, planar x/y
struct Point { double lon{}, lat{}; };

// polygon ring
struct Ring {
    // Closed or open ring of lon/lat points
    vector<Point> points;
};

// polygon shape
struct Polygon {
    // rings[0] = outer; rings[1..] = holes
    vector<Ring> rings;
    // bounding box for fast reject, only used when bounded
    bool bounded{false};
    double minLon{}, minLat{}, maxLon{}, maxLat{};
};

// tagged geojson geometry; a Polygon carries exactly one entry in polys
struct Geometry {
    string type;
    vector<Polygon> polys;
};

// Geometry tag outside Polygon/MultiPolygon
class UnsupportedGeometry : public std::runtime_error {
 public:
    explicit UnsupportedGeometry(const string& type)
        : std::runtime_error("Unsupported geometry type: '" + type + "'"), type_(type) {}
    const string& type() const { return type_; }

 private:
    string type_;
};

// Structurally broken geometry (wrong arity, degenerate exterior ring, ...)
class MalformedFeature : public std::runtime_error {
 public:
    explicit MalformedFeature(const string& what) : std::runtime_error(what) {}
};

void ringBounds(const Ring& ring, double* minLon, double* minLat, double* maxLon, double* maxLat);
void computeBounds(Polygon* poly);
bool pointInRing(const Ring& ring, const Point& point);
bool pointInPolygon(const Polygon& poly, const Point& point);
bool pointInGeometry(const Geometry& geom, const Point& point);
void validateGeometry(const Geometry& geom);
Geometry parseGeometry(const json& geom);
json geometryToJson(const Geometry& geom);

}  // namespace geometry

#endif  // REP_LOOKUP_GEOMETRY_HPP_
