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

#ifndef REP_LOOKUP_MAIN_HPP_
#define REP_LOOKUP_MAIN_HPP_

const char DEFAULT_BOUNDARIES[] = "data/ac_bangalore.geojson";
const char DEFAULT_BOUNDARY_DATA[] = "data/ac_data.json";
const char DEFAULT_REGION_DATA[] = "data/pc_data.json";
const long DEFAULT_TTL_SECONDS = 300;

// exit codes
const int EXIT_OK = 0;
const int EXIT_USAGE = 1;
const int EXIT_FATAL = 2;
const int EXIT_NOT_FOUND = 3;
const int EXIT_DATA_ERROR = 4;

#endif  // REP_LOOKUP_MAIN_HPP_
