#ifndef MULTIPROOF_CONFIG_HPP
#define MULTIPROOF_CONFIG_HPP

#include "curve.hpp"

namespace multiproof {

struct Config {
    // Workers for data-parallel steps; 1 runs everything on the calling thread
    size_t threads = 1;

    // Re-check intermediate algebra and print the results
    bool debug = false;

    /**
     * @brief Reads MULTIPROOF_THREADS and MULTIPROOF_DEBUG
     *
     * MULTIPROOF_THREADS must be a positive integer, "0" picks
     * std::thread::hardware_concurrency(). MULTIPROOF_DEBUG=1 turns on
     * debug checks. Unset or malformed values keep the defaults.
     */
    static Config fromEnv();
};

} // namespace multiproof

#endif // MULTIPROOF_CONFIG_HPP
