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
#include "fetch.hpp"
#include <curl/curl.h>  // for curl_easy_setopt, curl_easy_cleanup
#include <fstream>      // for basic_ifstream
#include <sstream>      // for basic_ostringstream
#include <stdexcept>    // for runtime_error
#include <string>       // for basic_string, string
#include <utility>      // for move

using std::string;
using std::ifstream;
using std::ostringstream;
using std::runtime_error;
using std::move;

namespace fetch {
    // Constructor initializes libcurl
    CurlHttpClient::CurlHttpClient() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    // Destructor cleans up libcurl resources
    CurlHttpClient::~CurlHttpClient() {
        curl_global_cleanup();
    }

    // Performs an HTTP GET request to the specified URL and returns the response
    //
    // Args:
    //    url: the URL to send the GET request to
    // Returns:
    //    HttpResponse containing the status code and response body
    HttpResponse CurlHttpClient::get(const string& url) {
        HttpResponse resp;
        string buffer;

        CURL* curl = curl_easy_init();
        if (!curl) throw runtime_error("curl_easy_init failed");

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            ostringstream oss;
            oss << "CURL error: " << curl_easy_strerror(res);
            curl_easy_cleanup(curl);
            throw runtime_error(oss.str());
        }

        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_cleanup(curl);

        resp.status = static_cast<uint16_t>(code);
        resp.body = move(buffer);
        return resp;
    }

    // Callback function for libcurl to write response data into a string
    //
    // Args:
    //    contents: pointer to the data received from the server
    //    size: size of each data element
    //    nmemb: number of data elements
    //    userData: pointer to the string to append to
    // Returns:
    //    total size of the data (size of each data element * number of data elements)
    size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userData) {
        size_t total = size * nmemb;
        auto* out = static_cast<string*>(userData);
        out->append(static_cast<char*>(contents), total);
        return total;
    }

    bool isUrl(const string& location) {
        return location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0;
    }

    // Reads a data source from disk, or over HTTP(S) when it is a URL
    //
    // Args:
    //    location: file path or http(s) URL
    //    http: client used for URLs; may be null when only files are read
    // Returns:
    //    the raw source text
    // Throws:
    //    runtime_error when the file can't be opened or the server doesn't answer 2xx
    string readSource(const string& location, IHttpClient* http) {
        if (isUrl(location)) {
            if (!http) throw runtime_error("No HTTP client available for " + location);
            const HttpResponse resp = http->get(location);
            if (resp.status < 200 || resp.status >= 300) {
                ostringstream oss;
                oss << "HTTP " << resp.status << " for URL: " << location;
                throw runtime_error(oss.str());
            }
            return resp.body;
        }

        ifstream in(location);
        if (!in) throw runtime_error("Failed to open: " + location);
        ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }
}  // namespace fetch
