#ifndef MULTIPROOF_ERROR_HPP
#define MULTIPROOF_ERROR_HPP

#include "curve.hpp"
#include <stdexcept>

namespace multiproof {

enum class ErrorKind {
    TooManyScalars,
    DivisorIsZero,
    NoPolynomialsGiven,
    EvalsIncorrectSize,
    SerializationError,
    NoPointsGiven,
    EvalsAndPolysDifferentSizes,
    EvalsAndPointsDifferentSizes,
    EvalsAndCommitsDifferentSizes,
    DomainConstructionFailed,
    DuplicatePoints,
    UnknownPointSet,
};

/**
 * @brief Usage and codec failures raised by the library
 *
 * counts() echoes the offending sizes in the order they are named by the
 * factory, e.g. evalsAndPolysDifferentSizes(nEvalRows, nPolys) gives
 * {nEvalRows, nPolys}. A proof that simply fails to verify is never an Error.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const string &message, vector<size_t> counts = {});

    ErrorKind kind() const { return kind_; }
    const vector<size_t> &counts() const { return counts_; }

    static Error tooManyScalars(size_t nCoeffs, size_t expectedMax);
    static Error divisorIsZero();
    static Error noPolynomialsGiven();
    static Error evalsIncorrectSize(size_t poly, size_t n, size_t expected);
    static Error serializationError();
    static Error noPointsGiven();
    static Error evalsAndPolysDifferentSizes(size_t nEvalRows, size_t nPolys);
    static Error evalsAndPointsDifferentSizes(size_t nEvals, size_t nPoints);
    static Error evalsAndCommitsDifferentSizes(size_t nEvals, size_t nCommits);
    static Error domainConstructionFailed(size_t size);
    static Error duplicatePoints(size_t index);
    static Error unknownPointSet(size_t index, size_t count);

private:
    ErrorKind kind_;
    vector<size_t> counts_;
};

const char *errorKindName(ErrorKind kind);

} // namespace multiproof

#endif // MULTIPROOF_ERROR_HPP
