#include "model/CoefficientBuilder.hpp"
#include <cmath>
#include <limits>
#include "Errors.hpp"

namespace Leontief {

IdentityDiagnostics LeontiefModel::diagnose() const {
    IdentityDiagnostics diag;
    if (size() == 0) return diag;
    // A*x + d == x
    diag.coefficient_residual = (A_ * output_ + demand_ - output_).cwiseAbs().maxCoeff();
    // L*d == x
    diag.inverse_residual = (L_ * demand_ - output_).cwiseAbs().maxCoeff();
    return diag;
}

std::shared_ptr<const LeontiefModel> CoefficientBuilder::build(const RawTable& table) {
    validate(table);

    const TableLayout& layout = table.layout;
    const int n = layout.n_sectors;
    const int n_fd = layout.final_demand_end - layout.final_demand_begin;

    // 1. Extract flows, final demand, output
    Mat flows = table.values.leftCols(n);
    Vec demand = table.values.middleCols(layout.final_demand_begin, n_fd).rowwise().sum();
    Vec output = table.values.col(layout.output_column);

    std::shared_ptr<LeontiefModel> model(new LeontiefModel());

    // 2. Technical coefficients
    model->A_ = technical_coefficients(flows, output);

    // 3. Leontief inverse
    model->I_minus_A_ = Mat::Identity(n, n) - model->A_;
    model->L_ = leontief_inverse(model->I_minus_A_);

    // 4. Benchmarks
    model->output_ = output;
    model->demand_ = demand;
    model->total_output_ = output.sum();
    model->total_final_demand_ = demand.sum();

    // Cost-push prices with unit cost plus markup: 1^T * L
    model->price_levels_ = model->L_.colwise().sum().transpose();
    model->labels_ = table.row_labels;

    return model;
}

CoefficientBuilder::Mat CoefficientBuilder::technical_coefficients(const Mat& flows, const Vec& output) {
    if (flows.cols() != output.size()) {
        throw DataIntegrityError("flow matrix has " + std::to_string(flows.cols()) +
                                 " columns but output has " + std::to_string(output.size()) + " entries");
    }

    Mat A(flows.rows(), flows.cols());
    for (Eigen::Index j = 0; j < flows.cols(); ++j) {
        const double x_j = output[j];
        for (Eigen::Index i = 0; i < flows.rows(); ++i) {
            double a = flows(i, j) / x_j;
            A(i, j) = std::isfinite(a) ? a : 0.0;
        }
    }
    return A;
}

CoefficientBuilder::Mat CoefficientBuilder::leontief_inverse(const Mat& i_minus_a) {
    const Eigen::Index n = i_minus_a.rows();
    if (n != i_minus_a.cols()) {
        throw DataIntegrityError("I - A is not square");
    }

    // Use PartialPivLU for general square matrix
    Eigen::PartialPivLU<Mat> lu(i_minus_a);

    // rcond is NaN or 0 when a pivot vanishes
    const double rcond = lu.rcond();
    if (!(rcond > std::numeric_limits<double>::epsilon())) {
        throw SingularMatrixError("I - A is not invertible (rcond = " + std::to_string(rcond) + ")");
    }

    Mat inv = lu.inverse();
    if (!inv.allFinite()) {
        throw SingularMatrixError("inverse of I - A has non-finite entries");
    }
    return inv;
}

void CoefficientBuilder::validate(const RawTable& table) {
    const TableLayout& l = table.layout;
    const int n = l.n_sectors;

    if (n < 1) {
        throw DataIntegrityError("table has no sectors");
    }
    if (table.rows() != n || static_cast<int>(table.row_labels.size()) != n) {
        throw DataIntegrityError("expected " + std::to_string(n) + " sector rows, got " +
                                 std::to_string(table.rows()) + " values / " +
                                 std::to_string(table.row_labels.size()) + " labels");
    }
    if (static_cast<int>(table.column_labels.size()) != table.cols()) {
        throw DataIntegrityError("column labels do not match column count");
    }
    if (l.final_demand_begin < n || l.final_demand_end < l.final_demand_begin ||
        l.final_demand_end > table.cols() || l.output_column < n || l.output_column >= table.cols()) {
        throw DataIntegrityError("column layout does not fit a table with " +
                                 std::to_string(table.cols()) + " columns");
    }

    // Row i must be the same sector-country as flow column i
    for (int i = 0; i < n; ++i) {
        if (table.row_labels[i] != table.column_labels[i]) {
            throw DataIntegrityError("row " + std::to_string(i) + " label '" + table.row_labels[i] +
                                     "' does not match column label '" + table.column_labels[i] + "'");
        }
    }
}

} // namespace Leontief
