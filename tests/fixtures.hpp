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
#ifndef REP_LOOKUP_TESTS_FIXTURES_HPP_
#define REP_LOOKUP_TESTS_FIXTURES_HPP_

#include <string>
#include "../rep_lookup/boundary.hpp"
#include "../rep_lookup/geometry.hpp"
#include "../rep_lookup/metadata.hpp"
#include "../rep_lookup/region.hpp"
#include "../rep_lookup/store.hpp"

namespace fixtures {

// axis-aligned closed square ring
inline geometry::Ring square(double minLon, double minLat, double maxLon, double maxLat) {
    return geometry::Ring{ {
        {minLon, minLat}, {maxLon, minLat}, {maxLon, maxLat}, {minLon, maxLat}, {minLon, minLat}
    } };
}

inline geometry::Geometry polygon(const geometry::Ring& outer) {
    geometry::Polygon poly;
    poly.rings = { outer };
    geometry::computeBounds(&poly);
    return geometry::Geometry{ geometry::POLYGON, { poly } };
}

inline boundary::BoundaryFeature feature(const std::string& name, const geometry::Geometry& geom) {
    boundary::BoundaryFeature f;
    f.name = name;
    f.geometry = geom;
    f.properties = { {"AC_NAME", name} };
    return f;
}

inline metadata::MetadataRecord mlaRecord() {
    metadata::MetadataRecord r;
    r.name = "Rizwan Arshad";
    r.party = "INC";
    r.constituency = "Shivajinagar";
    r.constituencyNumber = "157";
    r.contact = "+91-80-22866530";
    r.email = "rizwanarshad.mla@karnataka.gov.in";
    return r;
}

inline metadata::MetadataRecord mpRecord() {
    metadata::MetadataRecord r;
    r.name = "PC Mohan";
    r.party = "BJP";
    r.constituency = "Bangalore Central";
    r.constituencyNumber = "25";
    r.contact = "+91-11-23034660";
    r.email = "pcmohan@sansad.nic.in";
    r.officeAddress = "335-C, Parliament House Annexe, New Delhi - 110001";
    return r;
}

// One square boundary around MG Road named Shivajinagar, mapped to
// Bangalore Central, with records for both
inline store::DataStore shivajinagarStore() {
    store::DataStore data;
    data.boundaries.push_back(feature("Shivajinagar", polygon(square(77.50, 12.90, 77.70, 13.05))));
    data.boundaryRecords.emplace("Shivajinagar", mlaRecord());
    data.regionRecords.emplace("Bangalore Central", mpRecord());
    data.regionTable = region::RegionTable(region::RegionListing{ {"Bangalore Central", {"Shivajinagar"}} });
    return data;
}

}  // namespace fixtures

#endif  // REP_LOOKUP_TESTS_FIXTURES_HPP_
