#include "../include/multiproof/transcript.hpp"
#include "../include/multiproof/kzg.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace std;

namespace multiproof {

namespace {

typedef unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> DigestContext;

DigestContext newContext(const EVP_MD *md) {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw runtime_error("Failed to initialize digest");
    }
    return ctx;
}

void update(EVP_MD_CTX *ctx, const void *data, size_t len) {
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw runtime_error("Failed to update digest");
    }
}

void updateLength(EVP_MD_CTX *ctx, uint64_t len) {
    uint8_t buf[8];
    for (size_t i = 0; i < 8; i++) buf[i] = uint8_t(len >> (8 * i));
    update(ctx, buf, sizeof(buf));
}

} // namespace

Transcript::Transcript(const string &label) : state_(32, 0) {
    static const string DOMAIN = "multiproof transcript v1";
    absorb('D', DOMAIN, reinterpret_cast<const uint8_t *>(label.data()), label.size());
}

void Transcript::absorb(uint8_t tag, const string &label, const uint8_t *data, size_t len) {
    DigestContext ctx = newContext(EVP_sha256());
    update(ctx.get(), state_.data(), state_.size());
    update(ctx.get(), &tag, 1);
    updateLength(ctx.get(), label.size());
    update(ctx.get(), label.data(), label.size());
    updateLength(ctx.get(), len);
    if (len > 0) update(ctx.get(), data, len);

    uint8_t hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw runtime_error("Failed to finalize SHA256 digest");
    }
    state_.assign(hash, hash + hash_len);
}

void Transcript::append(const string &label, const vector<uint8_t> &bytes) {
    absorb('A', label, bytes.data(), bytes.size());
}

vector<uint8_t> Transcript::challengeBytes(const string &label, size_t length) {
    uint8_t len_buf[8];
    for (size_t i = 0; i < 8; i++) len_buf[i] = uint8_t(uint64_t(length) >> (8 * i));
    absorb('C', label, len_buf, sizeof(len_buf));

    vector<uint8_t> out(length);
    if (length > 0) {
        DigestContext ctx = newContext(EVP_shake256());
        update(ctx.get(), state_.data(), state_.size());
        if (EVP_DigestFinalXOF(ctx.get(), out.data(), out.size()) != 1) {
            throw runtime_error("Failed to squeeze SHAKE256");
        }
    }

    // Ratchet so the next call never reuses this output
    absorb('R', label, out.data(), out.size());
    return out;
}

void transcribePointsAndEvals(Transcript &transcript, const vector<Fr> &points,
                              const vector<vector<Fr>> &evals, size_t fieldSize) {
    size_t n_points = points.size();

    vector<uint8_t> eval_bytes(fieldSize * n_points * evals.size());
    for (size_t i = 0; i < evals.size(); i++) {
        if (evals[i].size() != n_points) {
            throw Error::evalsIncorrectSize(i, evals[i].size(), n_points);
        }
        for (size_t j = 0; j < n_points; j++) {
            vector<uint8_t> b = toBytes(evals[i][j]);
            if (b.size() != fieldSize) throw Error::serializationError();
            copy(b.begin(), b.end(), eval_bytes.begin() + (i * n_points + j) * fieldSize);
        }
    }
    transcript.append("open evals", eval_bytes);

    vector<uint8_t> point_bytes(fieldSize * n_points);
    for (size_t i = 0; i < n_points; i++) {
        vector<uint8_t> b = toBytes(points[i]);
        if (b.size() != fieldSize) throw Error::serializationError();
        copy(b.begin(), b.end(), point_bytes.begin() + i * fieldSize);
    }
    transcript.append("open points", point_bytes);
}

void transcribeCommitments(Transcript &transcript, const string &label,
                           const vector<Commitment> &commits) {
    transcript.append(label, serializeCommitments(commits));
}

Fr getChallenge(Transcript &transcript, const string &label, size_t fieldSize) {
    vector<uint8_t> bytes = transcript.challengeBytes(label, fieldSize);

    // setArrayMod reads little-endian
    reverse(bytes.begin(), bytes.end());
    Fr ret;
    ret.setArrayMod(bytes.data(), bytes.size());
    return ret;
}

} // namespace multiproof
