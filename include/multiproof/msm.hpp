#ifndef MULTIPROOF_MSM_HPP
#define MULTIPROOF_MSM_HPP

#include "curve.hpp"
#include "error.hpp"
#include "serialize.hpp"

namespace multiproof {

/**
 * @brief sum_i scalars[i] * bases[i] over the first scalars.size() bases
 *
 * Throws TooManyScalars if there are more scalars than bases. G is G1 or G2.
 */
template <class G>
G msm(const vector<G> &bases, const vector<Fr> &scalars) {
    if (scalars.size() > bases.size()) {
        throw Error::tooManyScalars(scalars.size(), bases.size());
    }

    G ret;
    ret.clear();
    if (scalars.empty()) return ret;

    // mulVec may normalize its bases in place, keep the shared ones untouched
    vector<G> x(bases.begin(), bases.begin() + scalars.size());
    G::mulVec(ret, x.data(), scalars.data(), scalars.size());
    return ret;
}

// Window used by curvePowers for a batch of n scalars
size_t fixedBaseWindowSize(size_t n);

/**
 * @brief [e * base for e in exponents], normalized to affine
 *
 * Builds a table of d * 2^(w*k) * base for every window k and digit
 * d < 2^w once, then each product is one addition per window.
 */
template <class G>
vector<G> curvePowers(const vector<Fr> &exponents, const G &base) {
    size_t window = fixedBaseWindowSize(exponents.size());
    size_t scalar_bits = serializedSize<Fr>() * 8;
    size_t n_windows = (scalar_bits + window - 1) / window;
    size_t digits = size_t(1) << window;

    vector<vector<G>> table(n_windows, vector<G>(digits));
    G window_base = base;
    for (size_t k = 0; k < n_windows; k++) {
        table[k][0].clear();
        for (size_t d = 1; d < digits; d++) {
            G::add(table[k][d], table[k][d - 1], window_base);
        }
        // next window starts at 2^w times this one
        G::add(window_base, table[k][digits - 1], window_base);
    }

    vector<G> ret(exponents.size());
    for (size_t i = 0; i < exponents.size(); i++) {
        // Fr serializes little-endian
        vector<uint8_t> bytes = toBytes(exponents[i]);
        G acc;
        acc.clear();
        for (size_t k = 0; k < n_windows; k++) {
            size_t digit = 0;
            for (size_t b = 0; b < window; b++) {
                size_t bit = k * window + b;
                if (bit >= scalar_bits) break;
                digit |= size_t((bytes[bit / 8] >> (bit % 8)) & 1) << b;
            }
            if (digit != 0) G::add(acc, acc, table[k][digit]);
        }
        acc.normalize();
        ret[i] = acc;
    }
    return ret;
}

} // namespace multiproof

#endif // MULTIPROOF_MSM_HPP
