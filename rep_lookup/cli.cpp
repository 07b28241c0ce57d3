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
#include "cli.hpp"
#include <algorithm>             // for replace
#include <chrono>                // for duration_cast, seconds
#include <cmath>                 // for isfinite
#include <iostream>              // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>     // for basic_json
#include <sstream>               // for basic_istringstream
#include <stdexcept>             // for invalid_argument, out_of_range
#include <string>                // for basic_string, string, stod
#include <vector>                // for vector
#include "boundary.hpp"
#include "geometry.hpp"
#include "names.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::istream;
using std::ostream;
using std::istringstream;
using std::invalid_argument;
using std::out_of_range;
using json = nlohmann::json;

using service::LookupResult;
using service::LookupService;
using service::ServiceArea;

namespace cli {
    // Parses a whole string as a double
    //
    // Args:
    //    s: text such as "12.9716"
    //    out: parsed value, set on success
    // Returns:
    //    false when s is empty, has trailing characters or is out of range
    bool parseNumber(const string& s, double* out) {
        const string text = names::trim(s);
        if (text.empty()) return false;
        try {
            size_t used = 0;
            const double value = std::stod(text, &used);
            if (used != text.size()) return false;
            *out = value;
            return true;
        } catch (const invalid_argument&) {
            return false;
        } catch (const out_of_range&) {
            return false;
        }
    }

    // Longest ttl the cache clock can represent, in whole seconds
    double maxTtlSeconds() {
        using std::chrono::duration_cast;
        using std::chrono::seconds;
        return static_cast<double>(
            duration_cast<seconds>(service::ResultCache::Clock::duration::max()).count());
    }

    // Parses "minLat,maxLat,minLon,maxLon"
    bool parseBounds(const string& s, ServiceArea* out) {
        vector<double> values;
        istringstream in(s);
        string part;
        while (std::getline(in, part, ',')) {
            double v;
            if (!parseNumber(part, &v)) return false;
            values.push_back(v);
        }
        if (values.size() != 4) return false;
        if (values[0] > values[1] || values[2] > values[3]) return false;
        *out = ServiceArea{values[0], values[1], values[2], values[3]};
        return true;
    }

    // Parses arguments from main entry point
    //
    // Args:
    //    argc: number of arguments given
    //    argv: provided arguments
    //    out: pointer to the Args structure to set state on
    // Returns:
    //    false on --help, unknown flags, bad values or a missing required flag
    bool parseArgs(int argc, char** argv, Args* out) {
        for (int i = 1; i < argc; ++i) {
            string a(argv[i]);
            const bool hasValue = i + 1 < argc;
            if (a == "--help" || a == "-h") {
                return false;
            } else if (a == "--boundaries" && hasValue) {
                out->sources.boundaries = argv[++i];
            } else if (a == "--boundary-data" && hasValue) {
                out->sources.boundaryData = argv[++i];
            } else if (a == "--region-data" && hasValue) {
                out->sources.regionData = argv[++i];
            } else if (a == "--regions" && hasValue) {
                out->sources.regions = string(argv[++i]);
            } else if (a == "--ttl" && hasValue) {
                double ttl;
                if (!parseNumber(argv[++i], &ttl) || !std::isfinite(ttl) ||
                    ttl < 0 || ttl > maxTtlSeconds()) return false;
                out->ttlSeconds = static_cast<long>(ttl);
            } else if (a == "--lat" && hasValue) {
                double lat;
                if (!parseNumber(argv[++i], &lat)) return false;
                out->lat = lat;
            } else if (a == "--lon" && hasValue) {
                double lon;
                if (!parseNumber(argv[++i], &lon)) return false;
                out->lon = lon;
            } else if (a == "--name" && hasValue) {
                out->name = string(argv[++i]);
            } else if (a == "--bounds" && hasValue) {
                ServiceArea area;
                if (!parseBounds(argv[++i], &area)) return false;
                out->area = area;
            } else if (a.rfind("--", 0) != 0 && out->command.empty()) {
                out->command = a;
            } else {
                return false;
            }
        }

        if (out->command == "lookup") return out->lat.has_value() && out->lon.has_value();
        if (out->command == "geometry") return out->name.has_value();
        return out->command == "batch" || out->command == "list" || out->command == "health";
    }

    // CLI usage message output as console error message
    //
    // Args:
    //     exe: executable's name
    void usage(const char* exe) {
        cerr << "Usage:\n"
        << "  " << exe << " lookup --lat LAT --lon LON [options]\n"
        << "  " << exe << " batch [options] < points.txt   (one \"lat lon\" per line)\n"
        << "  " << exe << " list [options]\n"
        << "  " << exe << " geometry --name NAME [options]\n"
        << "  " << exe << " health [options]\n"
        << "Options:\n"
        << "  --boundaries PATH|URL     boundary geojson (default " << DEFAULT_BOUNDARIES << ")\n"
        << "  --boundary-data PATH|URL  boundary records (default " << DEFAULT_BOUNDARY_DATA << ")\n"
        << "  --region-data PATH|URL    region records (default " << DEFAULT_REGION_DATA << ")\n"
        << "  --regions PATH|URL        region table override {\"Region\": [\"Boundary\", ...]}\n"
        << "  --ttl SECONDS             result cache lifetime (default " << DEFAULT_TTL_SECONDS << ")\n"
        << "  --bounds a,b,c,d          service area minLat,maxLat,minLon,maxLon\n";
    }

    // One lookup, logged and written as json
    //
    // Returns:
    //    EXIT_OK, EXIT_USAGE for a rejected coordinate, EXIT_NOT_FOUND when
    //    no boundary contains the point
    static int lookupOne(const Args& args, LookupService* svc, double lat, double lon, ostream& out) {
        try {
            service::validateCoordinate(lat, lon, args.area);
        } catch (const invalid_argument& e) {
            cerr << "[error] " << e.what() << "\n";
            out << json{{"latitude", lat}, {"longitude", lon}, {"error", e.what()}}.dump() << "\n";
            return EXIT_USAGE;
        }

        const LookupResult result = svc->resolvePoint(lat, lon);
        out << service::lookupToJson(lat, lon, result).dump() << "\n";
        if (!result.boundaryMatch) {
            cerr << "[warn] No representatives found for coordinates (" << lat << ", " << lon
                 << "). Ensure the point falls within a known boundary.\n";
            return EXIT_NOT_FOUND;
        }
        cerr << "[info] Lookup (" << lat << ", " << lon << ") -> "
             << result.boundaryMatch->constituency << " | "
             << result.regionMatch->constituency << "\n";
        return EXIT_OK;
    }

    // Reads "lat lon" or "lat,lon" lines; blank lines and '#' comments are skipped
    static int runBatch(const Args& args, LookupService* svc, istream& in, ostream& out) {
        string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            const string text = names::trim(line);
            if (text.empty() || text[0] == '#') continue;

            string fields = text;
            std::replace(fields.begin(), fields.end(), ',', ' ');
            istringstream parts(fields);
            string latText, lonText, extra;
            double lat, lon;
            if (!(parts >> latText >> lonText) || (parts >> extra) ||
                !parseNumber(latText, &lat) || !parseNumber(lonText, &lon)) {
                cerr << "[warn] Line " << lineNo << ": expected \"lat lon\"\n";
                out << json{{"line", lineNo}, {"error", "expected \"lat lon\""}}.dump() << "\n";
                continue;
            }
            lookupOne(args, svc, lat, lon, out);
        }
        return EXIT_OK;
    }

    // Executes the parsed command against a loaded service
    //
    // Args:
    //    args: parsed command line
    //    svc: the lookup service
    //    in: input for batch queries
    //    out: where json results are written
    // Returns:
    //    process exit code
    int run(const Args& args, LookupService* svc, istream& in, ostream& out) {
        try {
            if (args.command == "lookup") {
                return lookupOne(args, svc, *args.lat, *args.lon, out);
            } else if (args.command == "batch") {
                return runBatch(args, svc, in, out);
            } else if (args.command == "list") {
                out << service::listingToJson(svc->listKnownBoundaries(), svc->listKnownRegions()).dump(2)
                    << "\n";
                return EXIT_OK;
            } else if (args.command == "geometry") {
                const auto* feature = svc->getBoundaryFeature(*args.name);
                if (!feature) {
                    cerr << "[warn] Boundary '" << *args.name << "' not found.\n";
                    return EXIT_NOT_FOUND;
                }
                out << boundary::featureCollectionJson(*feature).dump() << "\n";
                return EXIT_OK;
            } else if (args.command == "health") {
                out << service::healthToJson(svc->health()).dump(2) << "\n";
                return EXIT_OK;
            }
        } catch (const geometry::UnsupportedGeometry& e) {
            cerr << "[error] Internal data error: " << e.what() << "\n";
            return EXIT_DATA_ERROR;
        }
        cerr << "[error] Unknown command '" << args.command << "'\n";
        return EXIT_USAGE;
    }
}  // namespace cli
