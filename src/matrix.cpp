#include "cpe/matrix.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace caravel {

std::vector<MatrixAssignment> expand_matrix(const Matrix &matrix) {
    std::vector<MatrixAssignment> out;
    out.emplace_back();

    for (const auto &axis : matrix) {
        std::vector<MatrixAssignment> next;
        next.reserve(out.size() * axis.values.size());
        for (const auto &prefix : out) {
            for (const auto &value : axis.values) {
                MatrixAssignment combo = prefix;
                combo.emplace_back(axis.name, value);
                next.push_back(std::move(combo));
            }
        }
        out = std::move(next);
    }
    return out;
}

std::string context_name(const std::string &job_name, const MatrixAssignment &assignment) {
    if (assignment.empty())
        return job_name;

    std::string name = job_name + " (";
    for (size_t i = 0; i < assignment.size(); ++i) {
        if (i != 0)
            name += ", ";
        name += assignment[i].second;
    }
    name += ')';
    return name;
}

std::string context_slug(const std::string &job_name, const MatrixAssignment &assignment) {
    std::string slug = job_name;
    for (const auto &[axis, value] : assignment) {
        slug += '-';
        slug += value;
    }
    for (char &c : slug) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-')
            c = '_';
    }
    return slug;
}

} // namespace caravel
