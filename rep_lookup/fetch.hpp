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
#ifndef REP_LOOKUP_FETCH_HPP_
#define REP_LOOKUP_FETCH_HPP_

#include <stddef.h>  // for size_t
#include <cstdint>   // for uint16_t
#include <string>    // for string

using std::string;

namespace fetch {

const char USER_AGENT[] = "rep-lookup/1.0";

// Simple struct to hold HTTP response data
struct HttpResponse {
    uint16_t status = 0;
    string body;
};

// Interface for HTTP client (allows mocking in tests)
struct IHttpClient {
    virtual ~IHttpClient() = default;
    virtual HttpResponse get(const string& url) = 0;
};

// Concrete implementation of IHttpClient using libcurl
class CurlHttpClient : public IHttpClient {
 public:
    CurlHttpClient();
    ~CurlHttpClient() override;
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const string& url) override;

 private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userData);
};

bool isUrl(const string& location);
string readSource(const string& location, IHttpClient* http);

}  // namespace fetch

#endif  // REP_LOOKUP_FETCH_HPP_
