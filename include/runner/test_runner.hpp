#pragma once

#include "checker/diff_checker.hpp"
#include "common/cancellation.hpp"

#include <vector>

namespace das_integrity {

struct CategoryTask {
    const char* method;
    void (DiffChecker::*check)();
};

// Every method category, in launch order
const std::vector<CategoryTask>& integrity_categories();

/**
 * Run every category on its own task and wait for all of them.
 *
 * A category that fails (keys unavailable or any other error) is logged and
 * does not affect the others. Categories not yet started when the token is
 * cancelled are skipped. Prints the per-method report at the end.
 */
void run_integrity_tests(DiffChecker& checker, const CancellationToken& cancellation);

} // namespace das_integrity
