#pragma once
#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../RawTable.hpp"

namespace Leontief {

// Residuals of the output identities. These only hold approximately in
// published tables, so they are reported, never enforced.
struct IdentityDiagnostics {
    double coefficient_residual = 0.0;  // max |A*x + d - x|
    double inverse_residual = 0.0;      // max |L*d - x|
};

// Prepared Leontief model. Immutable once built; safe to share between
// concurrent readers.
class LeontiefModel {
public:
    using Mat = Eigen::MatrixXd;
    using Vec = Eigen::VectorXd;

    int size() const { return static_cast<int>(output_.size()); }

    const Mat& coefficients() const { return A_; }
    const Mat& i_minus_a() const { return I_minus_A_; }
    const Mat& leontief_inverse() const { return L_; }
    const Vec& output() const { return output_; }
    const Vec& demand() const { return demand_; }
    const Vec& price_levels() const { return price_levels_; }
    double total_output() const { return total_output_; }
    double total_final_demand() const { return total_final_demand_; }
    const std::vector<std::string>& sector_labels() const { return labels_; }

    IdentityDiagnostics diagnose() const;

private:
    friend class CoefficientBuilder;
    LeontiefModel() = default;

    Mat A_;
    Mat I_minus_A_;
    Mat L_;
    Vec output_;
    Vec demand_;
    Vec price_levels_;
    double total_output_ = 0.0;
    double total_final_demand_ = 0.0;
    std::vector<std::string> labels_;
};

class CoefficientBuilder {
public:
    using Mat = Eigen::MatrixXd;
    using Vec = Eigen::VectorXd;

    // Throws DataIntegrityError or SingularMatrixError; no partial model escapes.
    static std::shared_ptr<const LeontiefModel> build(const RawTable& table);

    // A[i,j] = flows[i,j] / output[j], non-finite quotients set to 0
    static Mat technical_coefficients(const Mat& flows, const Vec& output);

    // (I - A)^-1
    static Mat leontief_inverse(const Mat& i_minus_a);

private:
    static void validate(const RawTable& table);
};

} // namespace Leontief
