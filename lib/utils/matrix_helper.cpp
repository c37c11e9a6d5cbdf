#include "utils/matrix_helper.hpp"

namespace utils {

    namespace {
        template<typename MatrixType>
        constexpr bool is_sparse_type() {
            return std::is_same_v<MatrixType, Eigen::SparseMatrix<double>>;
        }
    }

    template<typename MatrixType>
    MatrixInfo MatrixHelper::check_matrix_properties(const MatrixType& matrix) {
        MatrixInfo info;

        info.num_rows = matrix.rows();
        info.num_cols = matrix.cols();
        info.is_sparse = is_sparse_type<MatrixType>();

        if (matrix.rows() == matrix.cols()) {
            info.symmetry_error = compute_symmetry_error(matrix);
            info.is_symmetric = info.symmetry_error <= 1e-12;
            info.trace_value = compute_trace(matrix);
        } else {
            info.symmetry_error = std::numeric_limits<double>::infinity();
            info.is_symmetric = false;
            info.trace_value = 0.0;
        }

        info.bandwidth = compute_bandwidth(matrix);

        return info;
    }

    template<typename MatrixType>
    double MatrixHelper::compute_symmetry_error(const MatrixType& matrix) {
        double max_error = 0.0;

        if constexpr (is_sparse_type<MatrixType>()) {
            for (int k = 0; k < matrix.outerSize(); ++k) {
                for (typename MatrixType::InnerIterator it(matrix, k); it; ++it) {
                    double error = std::abs(it.value() - matrix.coeff(it.col(), it.row()));
                    max_error = std::max(max_error, error);
                }
            }
        } else {
            int n = matrix.rows();
            for (int i = 0; i < n; ++i) {
                for (int j = i + 1; j < n; ++j) {  // Only check upper triangle
                    double error = std::abs(matrix.coeff(i, j) - matrix.coeff(j, i));
                    max_error = std::max(max_error, error);
                }
            }
        }

        return max_error;
    }

    template<typename MatrixType>
    bool MatrixHelper::check_symmetry_full(const MatrixType& matrix, double tolerance) {
        if (matrix.rows() != matrix.cols()) {
            return false;
        }
        return compute_symmetry_error(matrix) <= tolerance;
    }

    template<typename MatrixType>
    int MatrixHelper::compute_bandwidth(const MatrixType& matrix) {
        int bandwidth = 0;

        if constexpr (is_sparse_type<MatrixType>()) {
            for (int k = 0; k < matrix.outerSize(); ++k) {
                for (typename MatrixType::InnerIterator it(matrix, k); it; ++it) {
                    if (it.value() != 0.0) {
                        bandwidth = std::max(bandwidth, static_cast<int>(std::abs(it.row() - it.col())));
                    }
                }
            }
        } else {
            for (int i = 0; i < matrix.rows(); ++i) {
                for (int j = 0; j < matrix.cols(); ++j) {
                    if (matrix.coeff(i, j) != 0.0) {
                        bandwidth = std::max(bandwidth, std::abs(i - j));
                    }
                }
            }
        }

        return bandwidth;
    }

    // ============================================================================
    // HELPERS
    // ============================================================================ 
    template<typename MatrixType>
    void MatrixHelper::display_matrix(
        const MatrixType& matrix,
        const std::string& name,
        int precision,
        int max_rows,
        int max_cols
    ) {
        if (!name.empty()) {
            std::cout << "\n=== " << name << " ===" << std::endl;
        }
        
        int rows = matrix.rows();
        int cols = matrix.cols();
        
        // Set display limits
        int display_rows = (max_rows > 0) ? std::min(max_rows, rows) : rows;
        int display_cols = (max_cols > 0) ? std::min(max_cols, cols) : cols;
        
        std::ios_base::fmtflags flags = std::cout.flags();
        std::streamsize old_precision = std::cout.precision();
        std::cout << std::fixed << std::setprecision(precision);
        
        std::cout << "Dimensions: " << rows << " x " << cols;
        if (max_rows > 0 && rows > max_rows) std::cout << " (showing " << max_rows << " rows)";
        if (max_cols > 0 && cols > max_cols) std::cout << " (showing " << max_cols << " cols)";
        std::cout << std::endl;

        if constexpr (is_sparse_type<MatrixType>()) {
            std::cout << "Sparse matrix with " << matrix.nonZeros() << " non-zero elements:" << std::endl;
        }

        for (int i = 0; i < display_rows; ++i) {
            for (int j = 0; j < display_cols; ++j) {
                double val = matrix.coeff(i, j);
                if (std::abs(val) < 1e-15) {
                    std::cout << std::setw(precision + 8) << "0";
                } else {
                    std::cout << std::setw(precision + 8) << val;
                }
            }
            if (cols > display_cols) std::cout << " ...";
            std::cout << std::endl;
        }
        if (rows > display_rows) {
            std::cout << "..." << std::endl;
        }
        
        std::cout << std::endl;
        std::cout.flags(flags);
        std::cout.precision(old_precision);
    }

    template<typename MatrixType>
    double MatrixHelper::compute_trace(const MatrixType& matrix) {
        if constexpr (is_sparse_type<MatrixType>()) {
            double trace = 0.0;
            for (int k = 0; k < matrix.outerSize(); ++k) {
                for (typename MatrixType::InnerIterator it(matrix, k); it; ++it) {
                    if (it.row() == it.col()) {
                        trace += it.value();
                    }
                }
            }
            return trace;
        } else {
            return matrix.trace();
        }
    }


    // ============================================================================
    // EXPLICIT TEMPLATE INSTANTIATIONS
    // ============================================================================ 

    template MatrixInfo MatrixHelper::check_matrix_properties<Eigen::SparseMatrix<double>>(const Eigen::SparseMatrix<double>&);
    template MatrixInfo MatrixHelper::check_matrix_properties<Eigen::MatrixXd>(const Eigen::MatrixXd&);

    template double MatrixHelper::compute_symmetry_error<Eigen::SparseMatrix<double>>(const Eigen::SparseMatrix<double>&);
    template double MatrixHelper::compute_symmetry_error<Eigen::MatrixXd>(const Eigen::MatrixXd&);
    
    template bool MatrixHelper::check_symmetry_full<Eigen::SparseMatrix<double>>(const Eigen::SparseMatrix<double>&, double);
    template bool MatrixHelper::check_symmetry_full<Eigen::MatrixXd>(const Eigen::MatrixXd&, double);

    template int MatrixHelper::compute_bandwidth<Eigen::SparseMatrix<double>>(const Eigen::SparseMatrix<double>&);
    template int MatrixHelper::compute_bandwidth<Eigen::MatrixXd>(const Eigen::MatrixXd&);

    template void MatrixHelper::display_matrix<Eigen::SparseMatrix<double>>(const Eigen::SparseMatrix<double>&, const std::string&, int, int, int);
    template void MatrixHelper::display_matrix<Eigen::MatrixXd>(const Eigen::MatrixXd&, const std::string&, int, int, int);

    template double MatrixHelper::compute_trace<Eigen::SparseMatrix<double>>(const Eigen::SparseMatrix<double>&);
    template double MatrixHelper::compute_trace<Eigen::MatrixXd>(const Eigen::MatrixXd&);
}
