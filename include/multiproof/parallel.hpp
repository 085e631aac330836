#ifndef MULTIPROOF_PARALLEL_HPP
#define MULTIPROOF_PARALLEL_HPP

#include "curve.hpp"
#include <exception>

namespace multiproof {

/**
 * @brief Runs f(0) .. f(n - 1) on up to `threads` OpenMP workers
 *
 * Exceptions cannot leave an OpenMP region, so each index records its own
 * and the lowest failing index is rethrown once every call has finished.
 */
template <class F>
void forkJoin(size_t n, size_t threads, F f) {
    if (threads <= 1 || n <= 1) {
        for (size_t i = 0; i < n; i++) f(i);
        return;
    }

    int workers = int(threads < n ? threads : n);
    vector<std::exception_ptr> errors(n);

    #pragma omp parallel for schedule(dynamic, 1) num_threads(workers)
    for (size_t i = 0; i < n; i++) {
        try {
            f(i);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (auto &e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

} // namespace multiproof

#endif // MULTIPROOF_PARALLEL_HPP
