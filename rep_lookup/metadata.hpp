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
#ifndef REP_LOOKUP_METADATA_HPP_
#define REP_LOOKUP_METADATA_HPP_

#include <map>                    // for map
#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <string>                 // for string

using std::string;
using std::map;
using std::optional;
using json = nlohmann::json;

namespace metadata {

const char NOT_AVAILABLE[] = "Data not available";
const char NO_PARTY[] = "N/A";

// representative for a constituency, as in ac_data.json / pc_data.json
struct MetadataRecord {
    string name;
    string party;
    string constituency;
    optional<string> constituencyNumber;
    optional<string> contact;
    optional<string> email;
    optional<string> officeAddress;
};

// display name -> record; ordered so the case-insensitive scan is deterministic
using MetadataStore = map<string, MetadataRecord>;

// which lookup tier produced a record
enum class MatchTier { Exact, Normalized, CaseInsensitive, Placeholder };

struct Resolution {
    MetadataRecord record;
    MatchTier tier;
};

MetadataRecord placeholderRecord(const string& name);
Resolution resolveWithTier(const string& name, const MetadataStore& store);
MetadataRecord resolveRecord(const string& name, const MetadataStore& store);
const char* tierName(MatchTier tier);

MetadataRecord parseRecord(const string& key, const json& j);
MetadataStore parseMetadata(const json& j);
json recordToJson(const MetadataRecord& record);

}  // namespace metadata

#endif  // REP_LOOKUP_METADATA_HPP_
