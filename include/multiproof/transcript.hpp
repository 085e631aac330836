#ifndef MULTIPROOF_TRANSCRIPT_HPP
#define MULTIPROOF_TRANSCRIPT_HPP

#include "curve.hpp"
#include "serialize.hpp"

namespace multiproof {

struct Commitment;

/**
 * @brief Fiat-Shamir transcript owned by a single proving or verifying session
 *
 * Every append and every challenge is absorbed into a SHA-256 chaining
 * value together with its label and length, so the same ordered sequence
 * of calls always yields the same challenges and any change in data,
 * label or order changes them. Challenges are squeezed with SHAKE-256 and
 * then ratcheted back into the state.
 *
 * Move-only: a copy would fork the session.
 */
class Transcript {
public:
    explicit Transcript(const string &label);

    Transcript(const Transcript &) = delete;
    Transcript &operator=(const Transcript &) = delete;
    Transcript(Transcript &&) = default;
    Transcript &operator=(Transcript &&) = default;

    void append(const string &label, const vector<uint8_t> &bytes);

    vector<uint8_t> challengeBytes(const string &label, size_t length);

private:
    void absorb(uint8_t tag, const string &label, const uint8_t *data, size_t len);

    vector<uint8_t> state_;
};

/**
 * @brief Binds evaluations (polynomial-major) under "open evals", then
 * points under "open points"
 *
 * Throws EvalsIncorrectSize if a row does not have one entry per point.
 */
void transcribePointsAndEvals(Transcript &transcript, const vector<Fr> &points,
                              const vector<vector<Fr>> &evals, size_t fieldSize);

template <class T>
void transcribeGeneric(Transcript &transcript, const string &label, const T &value) {
    transcript.append(label, toBytes(value));
}

// All commitments concatenated, under one label
void transcribeCommitments(Transcript &transcript, const string &label,
                           const vector<Commitment> &commits);

// fieldSize challenge bytes under label, read big-endian and reduced mod r
Fr getChallenge(Transcript &transcript, const string &label, size_t fieldSize);

} // namespace multiproof

#endif // MULTIPROOF_TRANSCRIPT_HPP
