#include "../include/multiproof/serialize.hpp"
#include "../include/multiproof/kzg.hpp"

using namespace std;

namespace multiproof {

vector<uint8_t> serializeCommitment(const Commitment &c) {
    return toBytes(c.c);
}

Commitment deserializeCommitment(const vector<uint8_t> &bytes) {
    Commitment ret;
    ret.c = fromBytes<G1>(bytes);
    return ret;
}

vector<uint8_t> serializeCommitments(const vector<Commitment> &cs) {
    vector<uint8_t> ret;
    ret.reserve(cs.size() * serializedSize<G1>());
    for (const Commitment &c : cs) {
        vector<uint8_t> b = toBytes(c.c);
        ret.insert(ret.end(), b.begin(), b.end());
    }
    return ret;
}

vector<Commitment> deserializeCommitments(const vector<uint8_t> &bytes) {
    size_t width = serializedSize<G1>();
    if (bytes.size() % width != 0) throw Error::serializationError();

    vector<Commitment> ret(bytes.size() / width);
    for (size_t i = 0; i < ret.size(); i++) {
        ret[i].c = fromBytes<G1>(bytes.data() + i * width, width);
    }
    return ret;
}

vector<uint8_t> serializeProof(const Proof &proof) {
    return toBytes(proof.w);
}

Proof deserializeProof(const vector<uint8_t> &bytes) {
    Proof ret;
    ret.w = fromBytes<G1>(bytes);
    return ret;
}

} // namespace multiproof
