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
#ifndef REP_LOOKUP_NAMES_HPP_
#define REP_LOOKUP_NAMES_HPP_

#include <string>  // for string

using std::string;

namespace names {

string trim(const string& s);
string toLower(const string& s);
bool equalsIgnoreCase(const string& a, const string& b);
string stripReservationSuffix(const string& s);
string normalizeName(const string& s);

}  // namespace names

#endif  // REP_LOOKUP_NAMES_HPP_
