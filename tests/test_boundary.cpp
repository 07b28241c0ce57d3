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
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "../rep_lookup/boundary.hpp"
#include "../rep_lookup/geometry.hpp"
#include "fixtures.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;

using boundary::BoundaryFeature;
using boundary::detectName;
using boundary::detectNumber;
using boundary::parseBoundaries;
using boundary::locate;
using boundary::locateAll;
using boundary::boundaryNames;
using boundary::findBoundary;
using boundary::featureCollectionJson;

using geometry::Geometry;
using geometry::Polygon;
using geometry::Ring;

using fixtures::square;
using fixtures::polygon;
using fixtures::feature;

// -----------------------------------------------------------------------------
// Tests for detectName / detectNumber
// -----------------------------------------------------------------------------

TEST_CASE("detectName prefers AC_NAME over the other spellings") {
    const json props = {{"name", "lower"}, {"AC_Name", "mixed"}, {"AC_NAME", "Shivajinagar"}};
    CHECK(detectName(props) == "Shivajinagar");
}

TEST_CASE("detectName skips empty and non-string candidates") {
    const json props = {{"AC_NAME", "  "}, {"AC_Name", 42}, {"ac_name", "Hebbal "}};
    CHECK(detectName(props) == "Hebbal");
}

TEST_CASE("detectName falls back to Unknown") {
    CHECK(detectName(json{{"DIST_NAME", "BANGALORE"}}) == "Unknown");
    CHECK(detectName(json::object()) == "Unknown");
    CHECK(detectName(json(nullptr)) == "Unknown");
}

TEST_CASE("detectNumber reads string or numeric codes") {
    CHECK(detectNumber(json{{"AC_Code", "157"}}) == "157");
    CHECK(detectNumber(json{{"AC_NO", 158}}) == "158");
    CHECK(detectNumber(json{{"DIST_NAME", "BANGALORE"}}).empty());
}

// -----------------------------------------------------------------------------
// Tests for parseBoundaries
// -----------------------------------------------------------------------------

TEST_CASE("parseBoundaries keeps order and counts non-area features as skipped") {
    const json gj = json::parse(R"({
        "type": "FeatureCollection",
        "features": [
            { "type": "Feature", "properties": {"AC_NAME": "B"},
              "geometry": {"type": "Polygon", "coordinates": [[[0,0],[1,0],[1,1],[0,1],[0,0]]]} },
            { "type": "Feature", "properties": {"AC_NAME": "Line"},
              "geometry": {"type": "LineString", "coordinates": [[0,0],[1,1]]} },
            { "type": "Feature", "properties": {"AC_NAME": "Nothing"}, "geometry": null },
            { "type": "Feature", "properties": {"AC_NAME": "A"},
              "geometry": {"type": "MultiPolygon", "coordinates": [[[[2,2],[3,2],[3,3],[2,3],[2,2]]]]} }
        ]
    })");

    size_t skipped = 99;
    const auto features = parseBoundaries(gj, &skipped);

    REQUIRE(features.size() == 2);
    CHECK(features[0].name == "B");
    CHECK(features[1].name == "A");
    CHECK(features[1].geometry.type == geometry::MULTI_POLYGON);
    // the LineString counts, the null geometry does not
    CHECK(skipped == 1);
}

TEST_CASE("parseBoundaries drops degenerate rings once at load") {
    const json gj = json::parse(R"({
        "features": [
            { "properties": {"AC_NAME": "Flat"},
              "geometry": {"type": "Polygon", "coordinates": [[[0,0],[1,1],[0,0]]]} },
            { "properties": {"AC_NAME": "Empty"},
              "geometry": {"type": "MultiPolygon", "coordinates": [[]]} },
            { "properties": {"AC_NAME": "Good"},
              "geometry": {"type": "Polygon", "coordinates": [[[0,0],[1,0],[1,1],[0,1],[0,0]]]} }
        ]
    })");

    size_t skipped = 0;
    const auto features = parseBoundaries(gj, &skipped);

    REQUIRE(features.size() == 1);
    CHECK(features[0].name == "Good");
    CHECK(skipped == 2);

    vector<string> anomalies;
    CHECK(locate(features, geometry::Point{0.5, 0.5}, &anomalies) == &features[0]);
    CHECK(anomalies.empty());
}

TEST_CASE("parseBoundaries drops malformed features and counts them") {
    const json gj = json::parse(R"({
        "features": [
            { "properties": {"AC_NAME": "Broken"},
              "geometry": {"type": "Polygon", "coordinates": [[[0,0],["x",0],[1,1]]]} },
            { "properties": {"AC_NAME": "NoCoords"}, "geometry": {"type": "Polygon"} },
            { "properties": {"AC_NAME": "Good"},
              "geometry": {"type": "Polygon", "coordinates": [[[0,0],[1,0],[1,1],[0,1],[0,0]]]} }
        ]
    })");

    size_t skipped = 0;
    const auto features = parseBoundaries(gj, &skipped);

    REQUIRE(features.size() == 1);
    CHECK(features[0].name == "Good");
    CHECK(skipped == 2);
}

TEST_CASE("parseBoundaries requires a features array") {
    size_t skipped = 0;
    CHECK_THROWS_AS(parseBoundaries(json{{"type", "FeatureCollection"}}, &skipped), std::runtime_error);
    CHECK_THROWS_AS(parseBoundaries(json::array(), nullptr), std::runtime_error);
}

// -----------------------------------------------------------------------------
// Tests for locate / locateAll
// -----------------------------------------------------------------------------

TEST_CASE("locate returns the first matching feature in dataset order") {
    const vector<BoundaryFeature> features = {
        feature("Small", polygon(square(1, 1, 3, 3))),
        feature("Big", polygon(square(0, 0, 10, 10))),
    };

    const BoundaryFeature* hit = locate(features, {2, 2});
    REQUIRE(hit != nullptr);
    CHECK(hit->name == "Small");

    hit = locate(features, {8, 8});
    REQUIRE(hit != nullptr);
    CHECK(hit->name == "Big");
}

TEST_CASE("locate order decides overlaps, not area") {
    const vector<BoundaryFeature> features = {
        feature("Big", polygon(square(0, 0, 10, 10))),
        feature("Small", polygon(square(1, 1, 3, 3))),
    };

    const BoundaryFeature* hit = locate(features, {2, 2});
    REQUIRE(hit != nullptr);
    CHECK(hit->name == "Big");
}

TEST_CASE("locate returns nullptr outside every boundary") {
    const vector<BoundaryFeature> features = {
        feature("Shivajinagar", polygon(square(77.50, 12.90, 77.70, 13.05))),
    };

    CHECK(locate(features, {77.60, 12.80}) == nullptr);
    CHECK(locate(vector<BoundaryFeature>{}, {0, 0}) == nullptr);
}

TEST_CASE("locate skips malformed features and records them") {
    BoundaryFeature degenerate;
    degenerate.name = "Degenerate";
    Polygon flat;
    flat.rings = { Ring{ { {0, 0}, {10, 10} } } };
    degenerate.geometry = Geometry{ geometry::POLYGON, { flat } };

    const vector<BoundaryFeature> features = {
        degenerate,
        feature("Good", polygon(square(0, 0, 10, 10))),
    };

    vector<string> anomalies;
    const BoundaryFeature* hit = locate(features, {5, 5}, &anomalies);

    REQUIRE(hit != nullptr);
    CHECK(hit->name == "Good");
    REQUIRE(anomalies.size() == 1);
    CHECK(anomalies[0].find("Degenerate") != string::npos);

    // null anomaly list is fine too
    CHECK(locate(features, {5, 5}) != nullptr);
}

TEST_CASE("locate propagates unsupported geometry") {
    BoundaryFeature line;
    line.name = "Line";
    line.geometry = Geometry{ "LineString", {} };

    const vector<BoundaryFeature> features = { line };

    CHECK_THROWS_AS(locate(features, {0, 0}), geometry::UnsupportedGeometry);
}

TEST_CASE("locateAll returns every match in order") {
    const vector<BoundaryFeature> features = {
        feature("Big", polygon(square(0, 0, 10, 10))),
        feature("Elsewhere", polygon(square(20, 20, 30, 30))),
        feature("Small", polygon(square(1, 1, 3, 3))),
    };

    const auto hits = locateAll(features, {2, 2});

    REQUIRE(hits.size() == 2);
    CHECK(hits[0]->name == "Big");
    CHECK(hits[1]->name == "Small");
    CHECK(locateAll(features, {50, 50}).empty());
}

// -----------------------------------------------------------------------------
// Tests for boundaryNames / findBoundary / featureCollectionJson
// -----------------------------------------------------------------------------

TEST_CASE("boundaryNames is sorted") {
    const vector<BoundaryFeature> features = {
        feature("Shivajinagar", polygon(square(0, 0, 1, 1))),
        feature("Hebbal", polygon(square(1, 1, 2, 2))),
        feature("Jayanagar", polygon(square(2, 2, 3, 3))),
    };

    CHECK((boundaryNames(features) == vector<string>{"Hebbal", "Jayanagar", "Shivajinagar"}));
}

TEST_CASE("findBoundary matches names case-insensitively") {
    const vector<BoundaryFeature> features = {
        feature("Shivajinagar", polygon(square(0, 0, 1, 1))),
    };

    const BoundaryFeature* hit = findBoundary(features, "SHIVAJINAGAR");
    REQUIRE(hit != nullptr);
    CHECK(hit->name == "Shivajinagar");
    CHECK(findBoundary(features, "Shivaji") == nullptr);
}

TEST_CASE("featureCollectionJson wraps the feature") {
    const BoundaryFeature f = feature("Shivajinagar", polygon(square(0, 0, 1, 1)));
    const json fc = featureCollectionJson(f);

    CHECK(fc["type"] == "FeatureCollection");
    REQUIRE(fc["features"].size() == 1);
    CHECK(fc["features"][0]["type"] == "Feature");
    CHECK(fc["features"][0]["properties"]["AC_NAME"] == "Shivajinagar");
    CHECK(fc["features"][0]["geometry"]["type"] == "Polygon");
}
