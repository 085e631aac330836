#include "../include/multiproof/msm.hpp"

namespace multiproof {

size_t fixedBaseWindowSize(size_t n) {
    if (n < 32) return 3;

    // floor(log2 n)
    size_t log2 = 0;
    while ((size_t(1) << (log2 + 1)) <= n) log2++;
    return log2 * 69 / 100;
}

} // namespace multiproof
