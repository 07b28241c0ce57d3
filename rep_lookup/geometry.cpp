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
#include "geometry.hpp"
#include <algorithm>             // for max, min, any_of
#include <cmath>                 // for isfinite
#include <cstddef>               // for size_t
#include <nlohmann/json.hpp>     // for basic_json
#include <sstream>               // for basic_ostringstream
#include <string>                // for basic_string, string
#include <utility>               // for move
#include <vector>                // for vector

using std::string;
using std::vector;
using std::min;
using std::max;
using std::move;
using std::isfinite;
using std::ostringstream;
using json = nlohmann::json;

namespace geometry {
    // Compute axis-aligned bounding box for given polygon ring
    //
    // Args:
    //    ring: reference to a polygon ring
    //    minLon: minimum longitude component of the ring's bounding box computed here
    //    minLat: minimum latitude component of the ring's bounding box computed here
    //    maxLon: maximum longitude component of the ring's bounding box computed here
    //    maxLat: maximum latitude component of the ring's bounding box computed here
    void ringBounds(const Ring& ring, double* minLon, double* minLat, double* maxLon, double* maxLat) {
        *minLon =  1e300; *minLat =  1e300;
        *maxLon = -1e300; *maxLat = -1e300;
        for (const auto& point : ring.points) {
            *minLon = min(*minLon, point.lon);
            *minLat = min(*minLat, point.lat);
            *maxLon = max(*maxLon, point.lon);
            *maxLat = max(*maxLat, point.lat);
        }
    }

    // Sets the polygon's bounding box from all of its rings.
    // A polygon without rings stays unbounded.
    void computeBounds(Polygon* poly) {
        poly->bounded = false;
        if (poly->rings.empty()) return;
        ringBounds(poly->rings.front(), &poly->minLon, &poly->minLat, &poly->maxLon, &poly->maxLat);
        for (size_t i = 1; i < poly->rings.size(); ++i) {
            double rminLon, rminLat, rmaxLon, rmaxLat;
            ringBounds(poly->rings[i], &rminLon, &rminLat, &rmaxLon, &rmaxLat);
            poly->minLon = min(poly->minLon, rminLon);
            poly->minLat = min(poly->minLat, rminLat);
            poly->maxLon = max(poly->maxLon, rmaxLon);
            poly->maxLat = max(poly->maxLat, rmaxLat);
        }
        poly->bounded = true;
    }

    // Ray casting for point in ring; a ray is cast east from q and every edge
    // it crosses toggles inside. Points exactly on an edge are unspecified.
    bool pointInRing(const Ring& ring, const Point& q) {
        bool inside = false;
        const auto& points = ring.points;
        const size_t n = points.size();
        if (n < 3) return false;
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const Point& a = points[j];
            const Point& b = points[i];
            // straddle test guarantees a.lat != b.lat below
            const bool intersect = ((b.lat > q.lat) != (a.lat > q.lat)) &&
                (q.lon < (a.lon - b.lon) * (q.lat - b.lat) / (a.lat - b.lat) + b.lon);
            if (intersect) inside = !inside;
        }
        return inside;
    }

    // Returns true if point is inside polygon
    //
    // Args:
    //     poly: the polygon, exterior ring first then holes
    //     point: the point lon/lat to check inside polygon
    // Returns:
    //     true if point sits inside the exterior ring and outside every hole
    bool pointInPolygon(const Polygon& poly, const Point& point) {
        if (poly.rings.empty()) return false;
        // Fast bounding box reject
        if (poly.bounded && (
            point.lon < poly.minLon ||
            point.lon > poly.maxLon ||
            point.lat < poly.minLat ||
            point.lat > poly.maxLat))
            return false;
        // Inside outer?
        if (!pointInRing(poly.rings.front(), point)) return false;
        // Not inside any hole
        for (size_t i = 1; i < poly.rings.size(); ++i) {
            if (pointInRing(poly.rings[i], point)) return false;
        }
        return true;
    }

    // Returns true if point is inside a Polygon or MultiPolygon geometry
    //
    // Args:
    //     geom: tagged geometry
    //     point: the point lon/lat to test
    // Returns:
    //     true if contained
    // Throws:
    //     UnsupportedGeometry for any other geometry tag
    bool pointInGeometry(const Geometry& geom, const Point& point) {
        if (geom.type == POLYGON) {
            if (geom.polys.empty()) return false;
            return pointInPolygon(geom.polys.front(), point);
        }
        if (geom.type == MULTI_POLYGON) {
            return std::any_of(
                geom.polys.begin(),
                geom.polys.end(),
                [&](const auto& poly) {
                    return pointInPolygon(poly, point);
                });
        }
        throw UnsupportedGeometry(geom.type);
    }

    // Checks a geometry is structurally usable for point location
    //
    // Args:
    //     geom: the geometry to check
    // Throws:
    //     UnsupportedGeometry for an unknown tag
    //     MalformedFeature for missing rings, degenerate exterior rings
    //         or non-finite coordinates
    void validateGeometry(const Geometry& geom) {
        if (geom.type != POLYGON && geom.type != MULTI_POLYGON)
            throw UnsupportedGeometry(geom.type);
        if (geom.type == POLYGON && geom.polys.size() != 1)
            throw MalformedFeature("Polygon must hold exactly one ring set");

        for (size_t p = 0; p < geom.polys.size(); ++p) {
            const auto& poly = geom.polys[p];
            if (poly.rings.empty()) {
                ostringstream oss;
                oss << "polygon " << p << " has no exterior ring";
                throw MalformedFeature(oss.str());
            }
            const auto& outer = poly.rings.front().points;
            size_t distinct = outer.size();
            if (distinct > 0 &&
                outer.front().lon == outer.back().lon &&
                outer.front().lat == outer.back().lat)
                --distinct;
            if (distinct < 3) {
                ostringstream oss;
                oss << "polygon " << p << " exterior ring has " << distinct << " distinct vertices";
                throw MalformedFeature(oss.str());
            }
            for (const auto& ring : poly.rings) {
                for (const auto& pt : ring.points) {
                    if (!isfinite(pt.lon) || !isfinite(pt.lat)) {
                        ostringstream oss;
                        oss << "polygon " << p << " has a non-finite coordinate";
                        throw MalformedFeature(oss.str());
                    }
                }
            }
        }
    }

    // Parses one geojson polygon coordinate block into a Polygon
    //
    // Args:
    //     coords: [ [ [lon,lat], ... ], [hole...], ... ]
    // Returns:
    //     Polygon with closed rings and bounding box
    static Polygon parsePolygon(const json& coords) {
        if (!coords.is_array()) throw MalformedFeature("polygon coordinates must be an array");
        Polygon poly;
        for (const auto& ringCoords : coords) {
            if (!ringCoords.is_array()) throw MalformedFeature("ring must be an array of positions");
            Ring ring;
            for (const auto& p : ringCoords) {
                if (!p.is_array() || p.size() < 2 || !p[0].is_number() || !p[1].is_number())
                    throw MalformedFeature("position must be [lon, lat]");
                ring.points.push_back(Point{ p[0].get<double>(), p[1].get<double>() });
            }
            // ensure closed ring for numeric stability
            if (!ring.points.empty() && (
                    ring.points.front().lon != ring.points.back().lon ||
                    ring.points.front().lat != ring.points.back().lat)) {
                ring.points.push_back(ring.points.front());
            }
            poly.rings.push_back(move(ring));
        }
        computeBounds(&poly);
        return poly;
    }

    // Parses a geojson geometry object
    //
    // Args:
    //     geom: json object with "type" and "coordinates"
    // Returns:
    //     the tagged Geometry
    // Throws:
    //     UnsupportedGeometry when the type is not Polygon/MultiPolygon
    //     MalformedFeature when coordinates are missing or have the wrong shape
    Geometry parseGeometry(const json& geom) {
        if (!geom.is_object()) throw MalformedFeature("geometry must be an object");
        Geometry out;
        out.type = geom.value("type", "");
        if (out.type != POLYGON && out.type != MULTI_POLYGON)
            throw UnsupportedGeometry(out.type);
        if (!geom.contains("coordinates") || !geom["coordinates"].is_array())
            throw MalformedFeature("geometry has no coordinates array");

        const auto& coords = geom["coordinates"];
        if (out.type == POLYGON) {
            out.polys.push_back(parsePolygon(coords));
        } else {
            for (const auto& polyCoords : coords) out.polys.push_back(parsePolygon(polyCoords));
        }
        return out;
    }

    // Serializes a geometry back to a geojson geometry object
    json geometryToJson(const Geometry& geom) {
        auto polygonCoords = [](const Polygon& poly) {
            json rings = json::array();
            for (const auto& ring : poly.rings) {
                json points = json::array();
                for (const auto& pt : ring.points) points.push_back(json::array({pt.lon, pt.lat}));
                rings.push_back(move(points));
            }
            return rings;
        };

        json coords = json::array();
        if (geom.type == POLYGON) {
            if (!geom.polys.empty()) coords = polygonCoords(geom.polys.front());
        } else {
            for (const auto& poly : geom.polys) coords.push_back(polygonCoords(poly));
        }
        return json{{"type", geom.type}, {"coordinates", coords}};
    }
}  // namespace geometry
