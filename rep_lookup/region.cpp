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
#include "region.hpp"
#include <algorithm>             // for sort
#include <nlohmann/json.hpp>     // for basic_json
#include <optional>              // for optional, nullopt
#include <stdexcept>             // for invalid_argument, runtime_error
#include <string>                // for basic_string, string
#include <utility>               // for pair
#include <vector>                // for vector
#include "names.hpp"

using std::string;
using std::vector;
using std::optional;
using std::nullopt;
using std::invalid_argument;
using std::runtime_error;
using json = nlohmann::json;

namespace region {
    // Builds the inverted index from the authoring listing
    //
    // Args:
    //    listing: region -> boundary names
    // Throws:
    //    invalid_argument when a boundary, or a case or suffix variant of it, is
    //    listed under two different regions
    RegionTable::RegionTable(const RegionListing& listing) {
        for (const auto& entry : listing) {
            const string regionName = names::trim(entry.first);
            regions_.push_back(regionName);
            for (const auto& raw : entry.second) {
                const string name = names::trim(raw);
                auto found = byName_.find(name);
                if (found != byName_.end() && found->second != regionName) {
                    throw invalid_argument("Boundary '" + name + "' listed under both '" +
                        found->second + "' and '" + regionName + "'");
                }
                const string key = names::toLower(names::normalizeName(name));
                auto variant = byKey_.find(key);
                if (variant != byKey_.end() && variant->second != regionName) {
                    throw invalid_argument("Boundary '" + name + "' is a variant of a name listed under '" +
                        variant->second + "', not '" + regionName + "'");
                }
                byName_[name] = regionName;
                byKey_.emplace(key, regionName);
            }
        }
        std::sort(regions_.begin(), regions_.end());
        regions_.erase(std::unique(regions_.begin(), regions_.end()), regions_.end());
    }

    // Region holding the boundary, tolerating whitespace, case and
    // reservation-suffix variants ("Anekal(SC)" vs "Anekal (SC)")
    //
    // Args:
    //    boundaryName: matched boundary name
    // Returns:
    //    region name, or nullopt when the boundary is unmapped
    optional<string> RegionTable::mapToRegion(const string& boundaryName) const {
        const string name = names::trim(boundaryName);
        auto exact = byName_.find(name);
        if (exact != byName_.end()) return exact->second;
        auto variant = byKey_.find(names::toLower(names::normalizeName(name)));
        if (variant != byKey_.end()) return variant->second;
        return nullopt;
    }

    // Sorted, distinct region names
    vector<string> RegionTable::regionNames() const {
        return regions_;
    }

    // Assembly -> parliamentary constituencies, 2008 ECI delimitation.
    // The "Bangalore South" assembly constituency belongs to Bangalore Rural.
    const RegionListing& bangaloreListing() {
        static const RegionListing listing = {
            {"Bangalore North", {
                "K.R.Pura", "Byatarayanapura", "Yeshvanthapura", "Dasarahalli",
                "Mahalakshmi Layout", "Malleshwaram", "Hebbal", "Pulakeshinagar(SC)",
                "Yelahanka"}},
            {"Bangalore Central", {
                "Shivajinagar", "Shanti Nagar", "Gandhi Nagar", "Rajaji Nagar",
                "Chamrajpet", "Chickpet", "Sarvagnanagar", "C.V. Raman Nagar(SC)",
                "Mahadevapura"}},
            {"Bangalore South", {
                "Govindraj Nagar", "Vijay Nagar", "Basavanagudi", "Padmanaba Nagar",
                "B.T.M Layout", "Jayanagar", "Bommanahalli"}},
            {"Bangalore Rural", {
                "Rajarajeshwarinagar", "Bangalore South", "Anekal (SC)", "Magadi",
                "Ramanagaram", "Kanakapura", "Channapatna", "Hosakote",
                "Doddaballapur", "Devanahalli (SC)", "Nelamangala (SC)"}},
        };
        return listing;
    }

    RegionTable defaultRegionTable() {
        return RegionTable(bangaloreListing());
    }

    // Reads a listing from json of the form {"Region": ["Boundary", ...], ...}
    RegionListing parseRegionListing(const json& j) {
        if (!j.is_object()) throw runtime_error("Region table must be a json object");
        RegionListing listing;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_array())
                throw runtime_error("Region '" + it.key() + "' must list boundary names");
            vector<string> boundaries;
            for (const auto& name : it.value()) {
                if (!name.is_string())
                    throw runtime_error("Region '" + it.key() + "' has a non-string boundary name");
                boundaries.push_back(name.get<string>());
            }
            listing.emplace_back(it.key(), boundaries);
        }
        return listing;
    }
}  // namespace region
