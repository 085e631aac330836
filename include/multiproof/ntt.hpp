#ifndef MULTIPROOF_NTT_HPP
#define MULTIPROOF_NTT_HPP

#include "curve.hpp"
#include <utility>

namespace multiproof {

// Hardcoded generator of Fr*
const int GENERATOR = 5;

// Largest k with 2^k | r - 1
const size_t TWO_ADICITY = 28;

/**
 * @brief Performs bit reversal for NTT
 * @param x The number to reverse bits for
 * @param logN Log base 2 of the array size
 * @return Bit-reversed number
 */
size_t bitReverse(size_t x, size_t logN);

/**
 * @brief Computes generator^((r - 1) / n), a primitive n-th root of unity
 * @param n The order of the root (must be a power of 2 not above 2^TWO_ADICITY)
 */
Fr getRootOfUnity(size_t n);

/**
 * @brief Performs Number Theoretic Transform (NTT) on the input array
 * @param A Input/output vector (size must be power of 2)
 * @param omega Primitive N-th root of unity where N = A.size()
 *
 * T is any additive group with a scalar action by Fr, so the same
 * transform runs over field vectors and over vectors of G1 points.
 * After calling this function, A[i] holds the evaluation at omega^i.
 */
template <class T>
void ntt_transform(vector<T> &A, const Fr &omega) {
    size_t n = A.size();
    size_t logN = 0;
    while ((size_t(1) << logN) < n) logN++;

    for (size_t i = 0; i < n; ++i) {
        size_t j = bitReverse(i, logN);
        if (i < j) std::swap(A[i], A[j]);
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        Fr wlen;
        Fr::pow(wlen, omega, n / len);
        for (size_t i = 0; i < n; i += len) {
            Fr w = 1;
            for (size_t j = 0; j < len / 2; ++j) {
                T u = A[i + j];
                T v;
                T::mul(v, A[i + j + len / 2], w);
                T::add(A[i + j], u, v);
                T::sub(A[i + j + len / 2], u, v);
                w *= wlen;
            }
        }
    }
}

/**
 * @brief Performs inverse Number Theoretic Transform (INTT)
 *
 * Undoes ntt_transform by using the inverse of omega and scaling by 1/N.
 */
template <class T>
void ntt_inverse(vector<T> &A, const Fr &omega) {
    Fr omega_inv;
    Fr::inv(omega_inv, omega);
    ntt_transform(A, omega_inv);

    Fr n_inv;
    Fr::inv(n_inv, Fr(A.size()));
    for (T &x : A) T::mul(x, x, n_inv);
}

/**
 * @brief Radix-2 multiplicative subgroup of Fr
 *
 * A domain requested for n elements has the smallest power-of-two size
 * N >= n. Inputs shorter than N are zero padded, longer inputs are
 * truncated to N.
 */
class EvaluationDomain {
public:
    // Throws DomainConstructionFailed(n) if n is 0 or N exceeds 2^TWO_ADICITY
    static EvaluationDomain create(size_t n);

    size_t size() const { return size_; }
    const Fr &groupGen() const { return omega_; }

    // omega^i
    Fr element(size_t i) const;

    vector<Fr> elements() const;

    template <class T>
    void fft(vector<T> &A) const {
        A.resize(size_);
        ntt_transform(A, omega_);
    }

    template <class T>
    void ifft(vector<T> &A) const {
        A.resize(size_);
        ntt_inverse(A, omega_);
    }

private:
    EvaluationDomain(size_t size, const Fr &omega) : size_(size), omega_(omega) {}

    size_t size_;
    Fr omega_;
};

} // namespace multiproof

#endif // MULTIPROOF_NTT_HPP
