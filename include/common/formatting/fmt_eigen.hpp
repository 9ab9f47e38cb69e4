// File: common/formatting/fmt_eigen.hpp

#ifndef FMT_EIGEN_HPP
#define FMT_EIGEN_HPP

#include <Eigen/Core>
#include <fmt/format.h>
#include <limits>

/*
 * fmt formatter for dense Eigen matrices and vectors.
 * Vectors (either orientation) print inline as "[a, b, c]", matrices print one bracketed row per line.
 * An optional precision selects fixed-point output: fmt::format("{:3}", v) -> "[0.125, 1.000]".
 */
template<typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
struct fmt::formatter<Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>> {
    int precision = -1;

    constexpr auto parse(fmt::format_parse_context &ctx) {
        auto it = ctx.begin();
        const auto end = ctx.end();
        if (it != end && *it >= '0' && *it <= '9') {
            precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                precision = precision * 10 + (*it - '0');
                ++it;
            }
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("Invalid format specifier for Eigen matrix");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> &mat, FormatContext &ctx) const {
        auto out = ctx.out();
        const bool is_vector = mat.rows() == 1 || mat.cols() == 1;
        const Eigen::Index outer = is_vector ? 1 : mat.rows();
        const Eigen::Index inner = is_vector ? mat.size() : mat.cols();

        for (Eigen::Index row = 0; row < outer; ++row) {
            if (row > 0) {
                *out++ = '\n';
            }
            *out++ = '[';
            for (Eigen::Index col = 0; col < inner; ++col) {
                if (col > 0) {
                    *out++ = ',';
                    *out++ = ' ';
                }
                const Scalar value = is_vector ? mat(col) : mat(row, col);
                out = precision >= 0 ? fmt::format_to(out, "{:.{}f}", value, precision)
                                     : fmt::format_to(out, "{:.{}g}", value, std::numeric_limits<Scalar>::digits10);
            }
            *out++ = ']';
        }
        return out;
    }
};

#endif // FMT_EIGEN_HPP
