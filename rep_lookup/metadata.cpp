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
#include "metadata.hpp"
#include <iostream>              // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>     // for basic_json
#include <optional>              // for optional, nullopt
#include <stdexcept>             // for runtime_error
#include <string>                // for basic_string, string
#include "names.hpp"

using std::string;
using std::cerr;
using std::optional;
using std::nullopt;
using std::runtime_error;
using json = nlohmann::json;

namespace metadata {
    // Record for a name with no data; same fields as a real record
    //
    // Args:
    //     name: the boundary or region name that missed every lookup tier
    // Returns:
    //     record with "not available" sentinels and no contact details
    MetadataRecord placeholderRecord(const string& name) {
        const string normalized = names::normalizeName(name);
        MetadataRecord record;
        record.name = NOT_AVAILABLE;
        record.party = NO_PARTY;
        record.constituency = normalized.empty() ? name : normalized;
        return record;
    }

    // Tiered lookup, first hit wins:
    //   1. exact key
    //   2. normalized key (reservation suffix stripped, whitespace collapsed)
    //   3. case-insensitive scan of every key against the normalized name
    // Falls back to placeholderRecord().
    //
    // Args:
    //     name: boundary or region display name
    //     store: records keyed by display name
    // Returns:
    //     the record and the tier that produced it
    Resolution resolveWithTier(const string& name, const MetadataStore& store) {
        auto exact = store.find(name);
        if (exact != store.end()) return {exact->second, MatchTier::Exact};

        const string normalized = names::normalizeName(name);
        if (!normalized.empty()) {
            auto stripped = store.find(normalized);
            if (stripped != store.end()) return {stripped->second, MatchTier::Normalized};

            for (const auto& kv : store) {
                if (names::equalsIgnoreCase(kv.first, normalized) ||
                    names::equalsIgnoreCase(names::normalizeName(kv.first), normalized)) {
                    return {kv.second, MatchTier::CaseInsensitive};
                }
            }
        }
        return {placeholderRecord(name), MatchTier::Placeholder};
    }

    MetadataRecord resolveRecord(const string& name, const MetadataStore& store) {
        return resolveWithTier(name, store).record;
    }

    const char* tierName(MatchTier tier) {
        switch (tier) {
            case MatchTier::Exact: return "exact";
            case MatchTier::Normalized: return "normalized";
            case MatchTier::CaseInsensitive: return "case-insensitive";
            case MatchTier::Placeholder: return "placeholder";
        }
        return "unknown";
    }

    // non-empty string (or number, for identifiers) field of a record
    static optional<string> optionalField(const json& j, const char* key) {
        if (!j.contains(key)) return nullopt;
        const auto& v = j[key];
        if (v.is_string()) {
            const string s = names::trim(v.get<string>());
            if (s.empty()) return nullopt;
            return s;
        }
        if (v.is_number_integer()) return std::to_string(v.get<long long>());
        return nullopt;
    }

    // Builds a record from one json entry of a metadata file
    //
    // Args:
    //     key: display name the entry is stored under
    //     j: the entry object
    // Returns:
    //     the record; missing name/party take the "not available" sentinels
    MetadataRecord parseRecord(const string& key, const json& j) {
        if (!j.is_object()) throw runtime_error("Record '" + key + "' is not a json object");
        MetadataRecord record;
        record.name = optionalField(j, "name").value_or(NOT_AVAILABLE);
        record.party = optionalField(j, "party").value_or(NO_PARTY);
        record.constituency = optionalField(j, "constituency").value_or(key);
        record.constituencyNumber = optionalField(j, "constituency_number");
        record.contact = optionalField(j, "contact");
        record.email = optionalField(j, "email");
        record.officeAddress = optionalField(j, "office_address");
        return record;
    }

    // Parses a metadata file: {"Display Name": {record}, ...}
    // Entries that are not objects are skipped with a warning.
    MetadataStore parseMetadata(const json& j) {
        if (!j.is_object()) throw runtime_error("Metadata must be a json object keyed by name");
        MetadataStore store;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_object()) {
                cerr << "[warn] Skipping metadata entry '" << it.key() << "': not an object\n";
                continue;
            }
            store.emplace(it.key(), parseRecord(it.key(), it.value()));
        }
        return store;
    }

    // Serializes a record, omitting absent optional fields
    json recordToJson(const MetadataRecord& record) {
        json j = {
            {"name", record.name},
            {"party", record.party},
            {"constituency", record.constituency}
        };
        if (record.constituencyNumber) j["constituency_number"] = *record.constituencyNumber;
        if (record.contact) j["contact"] = *record.contact;
        if (record.email) j["email"] = *record.email;
        if (record.officeAddress) j["office_address"] = *record.officeAddress;
        return j;
    }
}  // namespace metadata
