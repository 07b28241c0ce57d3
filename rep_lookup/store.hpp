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
#ifndef REP_LOOKUP_STORE_HPP_
#define REP_LOOKUP_STORE_HPP_

#include <stddef.h>    // for size_t
#include <optional>    // for optional
#include <string>      // for string
#include <vector>      // for vector
#include "boundary.hpp"
#include "fetch.hpp"
#include "metadata.hpp"
#include "region.hpp"

using std::string;
using std::vector;
using std::optional;

namespace store {

// where each dataset comes from; file paths or http(s) URLs
struct Sources {
    string boundaries;
    string boundaryData;
    string regionData;
    // region table override; the built-in table is used when absent
    optional<string> regions;
};

// Everything a lookup reads. Loaded once, never mutated afterwards.
struct DataStore {
    vector<boundary::BoundaryFeature> boundaries;
    metadata::MetadataStore boundaryRecords;
    metadata::MetadataStore regionRecords;
    region::RegionTable regionTable = region::defaultRegionTable();
    size_t skippedFeatures = 0;
};

vector<boundary::BoundaryFeature> loadBoundaries(
    const string& location, fetch::IHttpClient* http, size_t* skipped);
metadata::MetadataStore loadMetadata(const string& location, fetch::IHttpClient* http);
region::RegionTable loadRegionTable(const string& location, fetch::IHttpClient* http);
DataStore loadDataStore(const Sources& sources, fetch::IHttpClient* http);

}  // namespace store

#endif  // REP_LOOKUP_STORE_HPP_
