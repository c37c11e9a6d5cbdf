#ifndef FEM1D_MATRIX_HELPER_HPP
#define FEM1D_MATRIX_HELPER_HPP


#include <cmath>
#include <string> 
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <limits>
#include <type_traits>

#include <Eigen/Dense>
#include <Eigen/Sparse>

struct MatrixInfo {
    int num_rows;
    int num_cols;
    bool is_symmetric; 
    bool is_sparse;
    double symmetry_error;  // max |A_ij - A_ji|
    int bandwidth;          // max |i - j| over non-zero entries
    double trace_value;
};

namespace utils {
    class MatrixHelper {
        public:

            // ============================================================================
            // BASIC CHECKS
            // ============================================================================ 

            /**
             * @brief Check the properties of a matrix
             * @param matrix The matrix to check
             * @return A MatrixInfo struct containing the properties of the matrix
             */
            template<typename MatrixType>
            static MatrixInfo check_matrix_properties(const MatrixType& matrix);

            /**
             * @brief Largest asymmetry max |A_ij - A_ji| over all entries
             * @param matrix Square matrix
             */
            template<typename MatrixType>
            static double compute_symmetry_error(const MatrixType& matrix);

            /**
             * @brief Check if a matrix is symmetric within a tolerance
             * @param matrix The matrix to check
             * @param tolerance The tolerance for the symmetry check
             * @return True if the matrix is symmetric, false otherwise
             */
            template<typename MatrixType>
            static bool check_symmetry_full(const MatrixType& matrix, double tolerance);

            // largest distance |i - j| of an exactly non-zero entry from the diagonal
            template<typename MatrixType>
            static int compute_bandwidth(const MatrixType& matrix);

            // entries with |i - j| > 1 are exactly zero
            template<typename MatrixType>
            static bool is_tridiagonal(const MatrixType& matrix) {
                return compute_bandwidth(matrix) <= 1;
            }

            // ============================================================================
            // HELPERS
            // ============================================================================ 

            /**
             * @brief Display matrix in formatted terminal output
             * @param matrix The matrix to display
             * @param name Optional name/label for the matrix
             * @param precision Number of decimal places to show
             * @param max_rows Maximum number of rows to display (0 = all)
             * @param max_cols Maximum number of columns to display (0 = all)
             */
            template<typename MatrixType>
            static void display_matrix(
                const MatrixType& matrix,
                const std::string& name = "",
                int precision = 6,
                int max_rows = 0,
                int max_cols = 0
            );

            /**
             * @brief Compute the trace of a matrix
             * Manually calculate for the sparse matrix case.
             * Use the trace() method for the dense matrix case.
             * @param matrix The matrix to compute the trace of
             * @return The trace of the matrix
             */
            template<typename MatrixType>
            static double compute_trace(const MatrixType& matrix);
            
    };
}

#endif
