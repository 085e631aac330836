#include "../include/multiproof/config.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace std;

namespace multiproof {

Config Config::fromEnv() {
    Config config;

    const char *threads_env = getenv("MULTIPROOF_THREADS");
    if (threads_env) {
        char *end = nullptr;
        long threads = strtol(threads_env, &end, 10);
        if (end == threads_env || *end != '\0' || threads < 0) {
            cerr << "multiproof: ignoring MULTIPROOF_THREADS=" << threads_env << endl;
        } else if (threads == 0) {
            config.threads = max(1u, thread::hardware_concurrency());
        } else {
            config.threads = size_t(threads);
        }
    }

    const char *debug_env = getenv("MULTIPROOF_DEBUG");
    if (debug_env && string(debug_env) == "1") {
        config.debug = true;
    }

    return config;
}

} // namespace multiproof
