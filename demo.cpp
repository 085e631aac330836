#include "include/multiproof/method1.hpp"
#include "include/multiproof/method2.hpp"
#include "include/multiproof/polynomial.hpp"
#include "include/multiproof/serialize.hpp"
#include <iostream>
#include <vector>
#include <chrono>
#include <memory>

using namespace std;
using namespace multiproof;
using namespace std::chrono;

static vector<vector<Fr>> evaluateAll(const vector<Polynomial> &polys, const vector<Fr> &points) {
     vector<vector<Fr>> evals(polys.size());
     for (size_t i = 0; i < polys.size(); i++) {
          for (const Fr &x : points) evals[i].push_back(evaluatePoly(polys[i], x));
     }
     return evals;
}

int main() {
     initialize();
     Config config = Config::fromEnv();
     cout << "=== Multi-proof Protocol Demo ===" << endl;

     size_t n_polys = 20;
     size_t degree = 50;
     size_t n_points = 30;

     cout << "\nProving " << n_polys << " polynomials of degree " << degree
          << " at " << n_points << " points (" << config.threads << " threads)" << endl;

     cout << "\nStep 1: Setup..." << endl;
     Fr tau;
     tau.setByCSPRNG();

     auto t1 = high_resolution_clock::now();
     auto srs = make_shared<const SRS>(SRS::fromSecret(tau, degree + 1, n_points + 1));
     auto t2 = high_resolution_clock::now();
     cout << "[✓] SRS with " << srs->g1Powers.size() << " G1 and " << srs->g2Powers.size()
          << " G2 powers in " << duration_cast<milliseconds>(t2 - t1).count() << " ms" << endl;

     vector<Fr> points = randomScalars(n_points);

     t1 = high_resolution_clock::now();
     Method1 method1(srs, config);
     Method2 method2(srs, {points}, config);
     t2 = high_resolution_clock::now();
     cout << "[✓] Precomputed " << method2.domainCount() << " point set in "
          << duration_cast<milliseconds>(t2 - t1).count() << " ms" << endl;

     cout << "\nStep 2: Commit..." << endl;
     vector<Polynomial> polys = randomPolynomials(n_polys, degree);
     vector<vector<Fr>> evals = evaluateAll(polys, points);

     t1 = high_resolution_clock::now();
     vector<Commitment> commits = method1.commitAll(polys);
     t2 = high_resolution_clock::now();
     cout << "[✓] " << commits.size() << " commitments in "
          << duration_cast<milliseconds>(t2 - t1).count() << " ms" << endl;

     cout << "\nStep 3: Open..." << endl;
     t1 = high_resolution_clock::now();
     Transcript prover_transcript("demo");
     transcribeCommitments(prover_transcript, "commits", commits);
     Proof proof1 = method1.open(prover_transcript, evals, polys, points);
     t2 = high_resolution_clock::now();
     cout << "[✓] Method 1 proof (" << serializeProof(proof1).size() << " bytes) in "
          << duration_cast<milliseconds>(t2 - t1).count() << " ms" << endl;

     t1 = high_resolution_clock::now();
     Transcript prover_transcript2("demo");
     transcribeCommitments(prover_transcript2, "commits", commits);
     Proof proof2 = method2.open(prover_transcript2, evals, polys, 0);
     t2 = high_resolution_clock::now();
     cout << "[✓] Method 2 proof in " << duration_cast<milliseconds>(t2 - t1).count() << " ms" << endl;

     cout << "\nStep 4: Verify..." << endl;
     t1 = high_resolution_clock::now();
     Transcript verifier_transcript("demo");
     transcribeCommitments(verifier_transcript, "commits", commits);
     bool result1 = method1.verify(verifier_transcript, commits, points, evals, proof1);
     t2 = high_resolution_clock::now();
     cout << "[✓] Method 1 verifier in " << duration_cast<milliseconds>(t2 - t1).count() << " ms" << endl;

     t1 = high_resolution_clock::now();
     Transcript verifier_transcript2("demo");
     transcribeCommitments(verifier_transcript2, "commits", commits);
     bool result2 = method2.verify(verifier_transcript2, commits, 0, evals, proof2);
     t2 = high_resolution_clock::now();
     cout << "[✓] Method 2 verifier in " << duration_cast<milliseconds>(t2 - t1).count() << " ms" << endl;

     cout << "\n=== RESULT ===" << endl;
     cout << "Method 1: " << (result1 ? "VALID ✅" : "INVALID ❌") << endl;
     cout << "Method 2: " << (result2 ? "VALID ✅" : "INVALID ❌") << endl;

     // Claiming a wrong value must not verify
     cout << "\n=== Security Test: Wrong Evaluation ===" << endl;
     vector<vector<Fr>> wrong = evals;
     wrong[3][7] += 1;

     Transcript wrong_transcript("demo");
     transcribeCommitments(wrong_transcript, "commits", commits);
     bool wrong_result = method1.verify(wrong_transcript, commits, points, wrong, proof1);
     cout << "Verification with wrong evaluation: "
          << (wrong_result ? "VALID ❌ (ERROR!)" : "INVALID ✅ (Correct)") << endl;

     cout << "\n=== Shape Test: Missing Row ===" << endl;
     try {
          vector<vector<Fr>> short_evals(evals.begin(), evals.begin() + 19);
          Transcript t("demo");
          method1.open(t, short_evals, polys, points);
          cout << "Open accepted 19 rows for 20 polynomials ❌" << endl;
     } catch (const Error &e) {
          cout << errorKindName(e.kind()) << ": " << e.what() << " ✅" << endl;
     }

     return result1 && result2 && !wrong_result ? 0 : 1;
}
