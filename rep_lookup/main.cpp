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

// main.cpp

// 1. Project headers
#include "main.hpp"
#include "cli.hpp"
#include "fetch.hpp"
#include "service.hpp"
#include "store.hpp"

// 2. C++ system headers
#include <chrono>
#include <exception>
#include <iostream>

using std::cin;
using std::cout;
using std::cerr;
using std::exception;
using std::chrono::seconds;

// Entry point
int main(int argc, char** argv) {
    cli::Args args;
    if (!cli::parseArgs(argc, argv, &args)) {
        cli::usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        // 1) Load boundaries, records and the region table once
        fetch::CurlHttpClient http;
        const store::DataStore data = store::loadDataStore(args.sources, &http);
        cerr << "[info] Boundaries loaded: " << data.boundaries.size()
             << ", region mappings: " << data.regionTable.size() << "\n";

        // 2) Answer the command
        service::ResultCache cache;
        service::LookupService svc(data, &cache, seconds(args.ttlSeconds));
        return cli::run(args, &svc, cin, cout);
    } catch (const exception& e) {
        cerr << "Fatal: " << e.what() << "\n";
        return EXIT_FATAL;
    }
}
