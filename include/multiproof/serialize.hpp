#ifndef MULTIPROOF_SERIALIZE_HPP
#define MULTIPROOF_SERIALIZE_HPP

#include "curve.hpp"
#include "error.hpp"

namespace multiproof {

struct Commitment;
struct Proof;

// Large enough for a compressed G2 point on any supported curve
const size_t MAX_SERIALIZED_SIZE = 128;

/**
 * @brief Canonical fixed-width encoding of Fr, G1 or G2
 *
 * Group elements are compressed. Throws SerializationError if the codec
 * rejects the value.
 */
template <class T>
vector<uint8_t> toBytes(const T &x) {
    uint8_t buf[MAX_SERIALIZED_SIZE];
    size_t n = x.serialize(buf, sizeof(buf));
    if (n == 0) throw Error::serializationError();
    return vector<uint8_t>(buf, buf + n);
}

// Encoded width of T, constant per type
template <class T>
size_t serializedSize() {
    T zero;
    zero.clear();
    return toBytes(zero).size();
}

// Inverse of toBytes, rejecting trailing bytes
template <class T>
T fromBytes(const uint8_t *buf, size_t len) {
    T ret;
    if (len != serializedSize<T>()) throw Error::serializationError();
    size_t n = ret.deserialize(buf, len);
    if (n == 0 || n != len) throw Error::serializationError();
    return ret;
}

template <class T>
T fromBytes(const vector<uint8_t> &bytes) {
    return fromBytes<T>(bytes.data(), bytes.size());
}

vector<uint8_t> serializeCommitment(const Commitment &c);
Commitment deserializeCommitment(const vector<uint8_t> &bytes);

// Concatenated commitments, n * serializedSize<G1>() bytes
vector<uint8_t> serializeCommitments(const vector<Commitment> &cs);
vector<Commitment> deserializeCommitments(const vector<uint8_t> &bytes);

vector<uint8_t> serializeProof(const Proof &proof);
Proof deserializeProof(const vector<uint8_t> &bytes);

} // namespace multiproof

#endif // MULTIPROOF_SERIALIZE_HPP
