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
#ifndef REP_LOOKUP_CLI_HPP_
#define REP_LOOKUP_CLI_HPP_

#include <iosfwd>     // for istream, ostream
#include <optional>   // for optional
#include <string>     // for string
#include "main.hpp"
#include "service.hpp"
#include "store.hpp"

using std::string;
using std::optional;

namespace cli {

// input args for main entry point
struct Args {
    string command;
    store::Sources sources{DEFAULT_BOUNDARIES, DEFAULT_BOUNDARY_DATA, DEFAULT_REGION_DATA, {}};
    long ttlSeconds = DEFAULT_TTL_SECONDS;
    optional<double> lat;
    optional<double> lon;
    optional<string> name;
    optional<service::ServiceArea> area;
};

bool parseNumber(const string& s, double* out);
double maxTtlSeconds();
bool parseBounds(const string& s, service::ServiceArea* out);
bool parseArgs(int argc, char** argv, Args* out);
void usage(const char* exe);
int run(const Args& args, service::LookupService* svc, std::istream& in, std::ostream& out);

}  // namespace cli

#endif  // REP_LOOKUP_CLI_HPP_
