#include "../include/multiproof/curve.hpp"
#include <mutex>

namespace multiproof {

void initialize() {
    static std::once_flag once;
    std::call_once(once, [] { mcl::bn::initPairing(mcl::BN_SNARK1); });
}

} // namespace multiproof
