// File: types/candidate_pool.hpp

#ifndef CANDIDATE_POOL_HPP
#define CANDIDATE_POOL_HPP

#include <Eigen/Dense>
#include <utility>

#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace types {

    // Fixed set of candidate inputs (one per row) with the response observed when each one is evaluated.
    // The row index identifies a candidate everywhere else.
    template<FloatingPoint T = double>
    class CandidatePool {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

        CandidatePool(MatrixType features, VectorType responses) :
            features_(std::move(features)), responses_(std::move(responses)) {
            if (features_.rows() == 0 || features_.cols() == 0) {
                LOG_ERROR("Candidate pool must contain at least one point of one dimension, received {}x{}",
                          features_.rows(), features_.cols());
                throw common::ConfigurationError("Candidate pool must not be empty.");
            }
            if (features_.rows() != responses_.size()) {
                LOG_ERROR("Candidate pool has {} feature rows but {} responses", features_.rows(), responses_.size());
                throw common::ConfigurationError("Candidate pool features and responses differ in length.");
            }
            if (!features_.allFinite() || !responses_.allFinite()) {
                LOG_ERROR("Candidate pool contains non-finite values");
                throw common::ConfigurationError("Candidate pool values must be finite.");
            }
            LOG_DEBUG("Created candidate pool with {} points of dimension {}", size(), dimensions());
        }

        [[nodiscard]] Eigen::Index size() const noexcept { return features_.rows(); }
        [[nodiscard]] Eigen::Index dimensions() const noexcept { return features_.cols(); }

        [[nodiscard]] const MatrixType &features() const noexcept { return features_; }
        [[nodiscard]] const VectorType &responses() const noexcept { return responses_; }

    private:
        MatrixType features_;
        VectorType responses_;
    };

} // namespace types

#endif // CANDIDATE_POOL_HPP
