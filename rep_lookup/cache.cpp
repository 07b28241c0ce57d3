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
#include "cache.hpp"
#include <iomanip>   // for setprecision
#include <sstream>   // for basic_ostringstream
#include <string>    // for string

using std::string;
using std::fixed;
using std::setprecision;
using std::ostringstream;

namespace cache {
    // Key for a coordinate pair; fixed precision so "12.97" and "12.970000"
    // land on the same entry
    //
    // Args:
    //    lat: latitude
    //    lon: longitude
    // Returns:
    //    "lat,lon" with KEY_PRECISION decimals
    string cacheKey(double lat, double lon) {
        ostringstream oss;
        oss << fixed << setprecision(KEY_PRECISION) << lat << "," << lon;
        return oss.str();
    }
}  // namespace cache
