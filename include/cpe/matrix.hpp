#pragma once

#include "cpe/domain.hpp"

#include <string>
#include <vector>

namespace caravel {

/**
 * @brief Full cross product of the matrix axes.
 *
 * Axes are iterated in declaration order with the first axis outermost, so the
 * result is identical across runs. An empty matrix yields one empty assignment;
 * an axis without values yields no assignments at all.
 */
std::vector<MatrixAssignment> expand_matrix(const Matrix &matrix);

// "build (ubuntu-latest, 3.12)", or just the job name without a matrix.
std::string context_name(const std::string &job_name, const MatrixAssignment &assignment);

// Filesystem-safe identifier, e.g. "build-ubuntu-latest-3.12".
std::string context_slug(const std::string &job_name, const MatrixAssignment &assignment);

} // namespace caravel
