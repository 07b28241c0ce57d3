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
#include "names.hpp"
#include <algorithm>  // for equal, transform
#include <cctype>     // for isspace, tolower
#include <string>     // for basic_string, string

using std::string;

namespace names {
    // Removes leading and trailing whitespace
    string trim(const string& s) {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(begin, end - begin);
    }

    // ASCII lower-casing
    string toLower(const string& s) {
        string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return out;
    }

    bool equalsIgnoreCase(const string& a, const string& b) {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                return std::tolower(x) == std::tolower(y);
            });
    }

    // Strips trailing parenthetical qualifiers such as "(SC)" or "(ST)"
    //
    // Args:
    //     s: a constituency name, e.g. "Anekal (SC)" or "Pulakeshinagar(SC)"
    // Returns:
    //     the name without its qualifiers, e.g. "Anekal"
    string stripReservationSuffix(const string& s) {
        string out = trim(s);
        while (!out.empty() && out.back() == ')') {
            const size_t open = out.rfind('(');
            if (open == string::npos) break;
            out = trim(out.substr(0, open));
        }
        return out;
    }

    // Suffix stripped, whitespace runs collapsed to a single space, trimmed
    string normalizeName(const string& s) {
        const string stripped = stripReservationSuffix(s);
        string out;
        out.reserve(stripped.size());
        bool space = false;
        for (char c : stripped) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                space = true;
                continue;
            }
            if (space && !out.empty()) out.push_back(' ');
            space = false;
            out.push_back(c);
        }
        return out;
    }
}  // namespace names
