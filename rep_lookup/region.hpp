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
#ifndef REP_LOOKUP_REGION_HPP_
#define REP_LOOKUP_REGION_HPP_

#include <stddef.h>               // for size_t
#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <string>                 // for string
#include <unordered_map>          // for unordered_map
#include <utility>                // for pair
#include <vector>                 // for vector

using std::string;
using std::vector;
using std::optional;
using std::pair;
using std::unordered_map;
using json = nlohmann::json;

namespace region {

// authoring form: region -> boundary names in that region
using RegionListing = vector<pair<string, vector<string>>>;

// Static many-to-one boundary -> region mapping, built once and read-only after
class RegionTable {
 public:
    RegionTable() = default;
    explicit RegionTable(const RegionListing& listing);

    optional<string> mapToRegion(const string& boundaryName) const;
    vector<string> regionNames() const;
    size_t size() const { return byName_.size(); }

 private:
    // trimmed boundary name -> region
    unordered_map<string, string> byName_;
    // normalized, lower-cased boundary name -> region
    unordered_map<string, string> byKey_;
    vector<string> regions_;
};

const RegionListing& bangaloreListing();
RegionTable defaultRegionTable();
RegionListing parseRegionListing(const json& j);

}  // namespace region

#endif  // REP_LOOKUP_REGION_HPP_
