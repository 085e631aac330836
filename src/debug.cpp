#include "../include/multiproof/debug.hpp"
#include "../include/multiproof/method2.hpp"
#include "../include/multiproof/polynomial.hpp"
#include <iostream>

using namespace std;

namespace multiproof {

bool debugOpening(const Polynomial &aggregated, const Polynomial &interpolant,
                  const Polynomial &vanishing, const Polynomial &quotient,
                  const vector<Fr> &points, const vector<Fr> &aggEvals) {
    bool ok = true;

    cout << "Checking interpolant values...\n";
    for (size_t j = 0; j < points.size(); j++) {
        if (evaluatePoly(interpolant, points[j]) != aggEvals[j]) {
            cout << "At " << j << " interpolant failed\n";
            ok = false;
        }
    }

    cout << "Checking quotient...\n";
    vector<Fr> rebuilt(quotient.size() + vanishing.size(), 0);
    for (size_t i = 0; i < quotient.size(); i++) {
        for (size_t j = 0; j < vanishing.size(); j++) {
            rebuilt[i + j] += quotient[i] * vanishing[j];
        }
    }
    rebuilt = addPolynomials(rebuilt, interpolant);
    Polynomial expected = aggregated;
    trimPolynomial(rebuilt);
    trimPolynomial(expected);

    if (rebuilt == expected) cout << "Quotient verified.\n";
    else {
        // Evaluations were not those of the polynomials; the proof will not verify
        cout << "Quotient failed.\n";
        ok = false;
    }

    return ok;
}

bool debugDomain(const PrecomputedDomain &domain) {
    bool ok = true;
    size_t n = domain.points.size();

    for (size_t k = 0; k < n; k++) {
        if (!evaluatePoly(domain.vanishing, domain.points[k]).isZero()) {
            cout << "At " << k << " vanishing failed\n";
            ok = false;
        }
        for (size_t j = 0; j < n; j++) {
            Fr v = evaluatePoly(domain.lagrange[j], domain.points[k]);
            if (v != Fr(j == k ? 1 : 0)) {
                cout << "L_" << j << " at " << k << " failed\n";
                ok = false;
            }
        }
    }

    if (ok) cout << "Domain verified.\n";
    else cout << "Domain failed.\n";
    return ok;
}

} // namespace multiproof
