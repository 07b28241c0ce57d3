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
#include "store.hpp"
#include <exception>             // for exception
#include <iostream>              // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>     // for basic_json
#include <stdexcept>             // for runtime_error
#include <string>                // for basic_string, string
#include <utility>               // for move
#include <vector>                // for vector

using std::string;
using std::vector;
using std::cerr;
using std::exception;
using std::runtime_error;
using std::move;
using json = nlohmann::json;

using boundary::BoundaryFeature;
using metadata::MetadataStore;

namespace store {
    // Loads boundary polygons from a geojson FeatureCollection
    //
    // Args:
    //    location: file path or URL of the geojson
    //    http: client for URLs
    //    skipped: number of malformed features dropped, set here
    // Returns:
    //    boundary features in file order
    // Throws:
    //    runtime_error when the source can't be read, isn't json, or holds no polygons
    vector<BoundaryFeature> loadBoundaries(
        const string& location, fetch::IHttpClient* http, size_t* skipped) {
        const string body = fetch::readSource(location, http);
        json gj = json::parse(body, nullptr, false);
        if (gj.is_discarded()) throw runtime_error("Invalid JSON in " + location);

        auto features = boundary::parseBoundaries(gj, skipped);
        if (features.empty()) throw runtime_error("No boundary polygons loaded from " + location);
        cerr << "[info] Loaded " << features.size() << " boundaries from " << location << "\n";
        return features;
    }

    // Loads representative records; a missing or broken source yields an
    // empty store so lookups still answer with placeholder records
    //
    // Args:
    //    location: file path or URL of the json records
    //    http: client for URLs
    // Returns:
    //    records keyed by display name
    MetadataStore loadMetadata(const string& location, fetch::IHttpClient* http) {
        try {
            const string body = fetch::readSource(location, http);
            json j = json::parse(body, nullptr, false);
            if (j.is_discarded()) throw runtime_error("Invalid JSON in " + location);
            auto records = metadata::parseMetadata(j);
            cerr << "[info] Loaded " << records.size() << " records from " << location << "\n";
            return records;
        } catch (const exception& e) {
            cerr << "[error] " << e.what() << "\n";
            return {};
        }
    }

    // Loads a region table override: {"Region": ["Boundary", ...]}
    region::RegionTable loadRegionTable(const string& location, fetch::IHttpClient* http) {
        const string body = fetch::readSource(location, http);
        json j = json::parse(body, nullptr, false);
        if (j.is_discarded()) throw runtime_error("Invalid JSON in " + location);
        region::RegionTable table(region::parseRegionListing(j));
        cerr << "[info] Loaded " << table.size() << " region mappings from " << location << "\n";
        return table;
    }

    // Loads every dataset a lookup needs. Call once at startup.
    DataStore loadDataStore(const Sources& sources, fetch::IHttpClient* http) {
        DataStore data;
        data.boundaries = loadBoundaries(sources.boundaries, http, &data.skippedFeatures);
        if (data.skippedFeatures > 0) {
            cerr << "[warn] Skipped " << data.skippedFeatures << " malformed boundaries\n";
        }
        data.boundaryRecords = loadMetadata(sources.boundaryData, http);
        data.regionRecords = loadMetadata(sources.regionData, http);
        if (sources.regions) data.regionTable = loadRegionTable(*sources.regions, http);
        return data;
    }
}  // namespace store
