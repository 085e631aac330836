#include "../include/multiproof/error.hpp"
#include <sstream>

using namespace std;

namespace multiproof {

Error::Error(ErrorKind kind, const string &message, vector<size_t> counts)
    : runtime_error(message), kind_(kind), counts_(std::move(counts)) {}

Error Error::tooManyScalars(size_t nCoeffs, size_t expectedMax) {
    ostringstream ss;
    ss << "Polynomial given is too large: " << nCoeffs << " coefficients, at most " << expectedMax;
    return Error(ErrorKind::TooManyScalars, ss.str(), {nCoeffs, expectedMax});
}

Error Error::divisorIsZero() {
    return Error(ErrorKind::DivisorIsZero, "A divisor was zero");
}

Error Error::noPolynomialsGiven() {
    return Error(ErrorKind::NoPolynomialsGiven, "Expected polynomials, none were given");
}

Error Error::evalsIncorrectSize(size_t poly, size_t n, size_t expected) {
    ostringstream ss;
    ss << "Evaluations of polynomial " << poly << " have " << n << " entries, expected " << expected;
    return Error(ErrorKind::EvalsIncorrectSize, ss.str(), {poly, n, expected});
}

Error Error::serializationError() {
    return Error(ErrorKind::SerializationError, "Serialization error");
}

Error Error::noPointsGiven() {
    return Error(ErrorKind::NoPointsGiven, "Not given any points");
}

Error Error::evalsAndPolysDifferentSizes(size_t nEvalRows, size_t nPolys) {
    ostringstream ss;
    ss << "Given " << nEvalRows << " evaluations, but " << nPolys << " polynomials";
    return Error(ErrorKind::EvalsAndPolysDifferentSizes, ss.str(), {nEvalRows, nPolys});
}

Error Error::evalsAndPointsDifferentSizes(size_t nEvals, size_t nPoints) {
    ostringstream ss;
    ss << "Given " << nPoints << " points, but " << nEvals << " evals";
    return Error(ErrorKind::EvalsAndPointsDifferentSizes, ss.str(), {nEvals, nPoints});
}

Error Error::evalsAndCommitsDifferentSizes(size_t nEvals, size_t nCommits) {
    ostringstream ss;
    ss << "Given " << nCommits << " commits, but " << nEvals << " evals";
    return Error(ErrorKind::EvalsAndCommitsDifferentSizes, ss.str(), {nEvals, nCommits});
}

Error Error::domainConstructionFailed(size_t size) {
    ostringstream ss;
    ss << "Unable to construct a domain of size " << size;
    return Error(ErrorKind::DomainConstructionFailed, ss.str(), {size});
}

Error Error::duplicatePoints(size_t index) {
    ostringstream ss;
    ss << "Point " << index << " repeats an earlier point";
    return Error(ErrorKind::DuplicatePoints, ss.str(), {index});
}

Error Error::unknownPointSet(size_t index, size_t count) {
    ostringstream ss;
    ss << "Point set " << index << " is not registered (" << count << " registered)";
    return Error(ErrorKind::UnknownPointSet, ss.str(), {index, count});
}

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TooManyScalars: return "TooManyScalars";
    case ErrorKind::DivisorIsZero: return "DivisorIsZero";
    case ErrorKind::NoPolynomialsGiven: return "NoPolynomialsGiven";
    case ErrorKind::EvalsIncorrectSize: return "EvalsIncorrectSize";
    case ErrorKind::SerializationError: return "SerializationError";
    case ErrorKind::NoPointsGiven: return "NoPointsGiven";
    case ErrorKind::EvalsAndPolysDifferentSizes: return "EvalsAndPolysDifferentSizes";
    case ErrorKind::EvalsAndPointsDifferentSizes: return "EvalsAndPointsDifferentSizes";
    case ErrorKind::EvalsAndCommitsDifferentSizes: return "EvalsAndCommitsDifferentSizes";
    case ErrorKind::DomainConstructionFailed: return "DomainConstructionFailed";
    case ErrorKind::DuplicatePoints: return "DuplicatePoints";
    case ErrorKind::UnknownPointSet: return "UnknownPointSet";
    }
    return "Unknown";
}

} // namespace multiproof
