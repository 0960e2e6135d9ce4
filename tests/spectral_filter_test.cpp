#include "gfcpd/spectral_filter.hpp"
#include "gfcpd/errors.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace gfcpd {

using gfcpd_test::gaussian_matrix;
using gfcpd_test::path_laplacian;
using gfcpd_test::two_cluster_laplacian;

TEST(GfssGain, PassesFrequenciesUpToCutoff) {
    EXPECT_DOUBLE_EQ(gfss_gain(0.0, 0.5), 1.0);
    EXPECT_DOUBLE_EQ(gfss_gain(0.25, 0.5), 1.0);
    EXPECT_DOUBLE_EQ(gfss_gain(0.5, 0.5), 1.0);
}

TEST(GfssGain, DecaysAsInverseSquareRootAboveCutoff) {
    EXPECT_DOUBLE_EQ(gfss_gain(2.0, 0.5), 0.5);
    EXPECT_DOUBLE_EQ(gfss_gain(8.0, 0.5), 0.25);
    EXPECT_LT(gfss_gain(1e12, 1.0), 1e-5);

    double previous = 1.0;
    for (double lambda = 0.0; lambda < 20.0; lambda += 0.37) {
        const double g = gfss_gain(lambda, 1.3);
        EXPECT_GT(g, 0.0);
        EXPECT_LE(g, previous);
        previous = g;
    }
}

struct FilterCase {
    const char* graph;
    double rho;
};

class SpectralFilterTest : public testing::TestWithParam<FilterCase> {
 protected:
    void SetUp() override {
        param = GetParam();
        laplacian = (std::string(param.graph) == "path") ? path_laplacian(12)
                                                         : two_cluster_laplacian(1.0, 0.1);
    }

    FilterCase param;
    Eigen::MatrixXd laplacian;
};

TEST_P(SpectralFilterTest, FilterMatrixIsSymmetricWithSpectrumInUnitInterval) {
    spectral_filter_t filter(laplacian, param.rho);
    const Eigen::MatrixXd& f = filter.filter_matrix();

    EXPECT_LT((f - f.transpose()).cwiseAbs().maxCoeff(), 1e-14);

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(f);
    ASSERT_EQ(solver.info(), Eigen::Success);
    EXPECT_GE(solver.eigenvalues().minCoeff(), -1e-12);
    EXPECT_LE(solver.eigenvalues().maxCoeff(), 1.0 + 1e-12);
}

TEST_P(SpectralFilterTest, EigenvectorsAreScaledByTheirGains) {
    spectral_filter_t filter(laplacian, param.rho);
    const Eigen::MatrixXd& u = filter.eigenvectors();

    const Eigen::MatrixXd lhs = filter.filter_matrix() * u;
    const Eigen::MatrixXd rhs = u * filter.gains().asDiagonal();
    EXPECT_LT((lhs - rhs).cwiseAbs().maxCoeff(), 1e-10);

    for (Eigen::Index i = 0; i < filter.eigenvalues().size(); ++i) {
        EXPECT_DOUBLE_EQ(filter.gains()(i), gfss_gain(filter.eigenvalues()(i), param.rho));
    }
}

TEST_P(SpectralFilterTest, EigenvaluesAscendingAndNonNegative) {
    spectral_filter_t filter(laplacian, param.rho);
    const Eigen::VectorXd& lambda = filter.eigenvalues();

    ASSERT_EQ(static_cast<size_t>(lambda.size()), filter.n_nodes());
    EXPECT_EQ(lambda(0), 0.0);
    for (Eigen::Index i = 1; i < lambda.size(); ++i) {
        EXPECT_GE(lambda(i), lambda(i - 1));
    }
    EXPECT_EQ(filter.n_components(), 1u);
    EXPECT_DOUBLE_EQ(filter.rho(), param.rho);
}

TEST_P(SpectralFilterTest, ConstantSignalPassesUnchanged) {
    spectral_filter_t filter(laplacian, param.rho);
    const Eigen::MatrixXd constant = Eigen::MatrixXd::Constant(3, laplacian.rows(), 2.5);

    EXPECT_LT((filter.apply(constant) - constant).cwiseAbs().maxCoeff(), 1e-10);
}

TEST_P(SpectralFilterTest, ApplyIsLinear) {
    spectral_filter_t filter(laplacian, param.rho);
    const int d = static_cast<int>(laplacian.rows());
    const Eigen::MatrixXd x = gaussian_matrix(20, d, 1.0, 11u);
    const Eigen::MatrixXd y = gaussian_matrix(20, d, 1.0, 12u);

    const Eigen::MatrixXd combined = filter.apply(2.0 * x - 0.5 * y);
    const Eigen::MatrixXd separate = 2.0 * filter.apply(x) - 0.5 * filter.apply(y);
    EXPECT_LT((combined - separate).cwiseAbs().maxCoeff(), 1e-10);
}

TEST_P(SpectralFilterTest, FilteringNeverIncreasesEnergy) {
    spectral_filter_t filter(laplacian, param.rho);
    const Eigen::MatrixXd x = gaussian_matrix(50, static_cast<int>(laplacian.rows()), 1.0, 21u);

    EXPECT_LE(filter.apply(x).squaredNorm(), x.squaredNorm() * (1.0 + 1e-12));
}

TEST_P(SpectralFilterTest, GraphFourierTransformPreservesNorm) {
    spectral_filter_t filter(laplacian, param.rho);
    const Eigen::MatrixXd x = gaussian_matrix(15, static_cast<int>(laplacian.rows()), 1.0, 31u);

    const Eigen::MatrixXd coefficients = filter.gft(x);
    ASSERT_EQ(coefficients.rows(), x.rows());
    ASSERT_EQ(coefficients.cols(), x.cols());
    EXPECT_NEAR(coefficients.norm(), x.norm(), 1e-10);
}

INSTANTIATE_TEST_SUITE_P(Graphs,
                         SpectralFilterTest,
                         testing::Values(FilterCase{"path", 0.05},
                                         FilterCase{"path", 1.0},
                                         FilterCase{"two_clusters", 0.001},
                                         FilterCase{"two_clusters", 0.1},
                                         FilterCase{"two_clusters", 5.0}));

TEST(SpectralFilter, CutoffAboveSpectrumGivesIdentity) {
    const Eigen::MatrixXd laplacian = two_cluster_laplacian(1.0, 0.1);
    spectral_filter_t filter(laplacian, 100.0);

    const Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(10, 10);
    EXPECT_LT((filter.filter_matrix() - identity).cwiseAbs().maxCoeff(), 1e-10);
}

TEST(SpectralFilter, DisconnectedGraphKeepsComponentIndicators) {
    const Eigen::MatrixXd laplacian = two_cluster_laplacian(1.0, 0.0);
    spectral_filter_t filter(laplacian, 0.01);

    EXPECT_EQ(filter.n_components(), 2u);
    EXPECT_EQ(filter.eigenvalues()(0), 0.0);
    EXPECT_EQ(filter.eigenvalues()(1), 0.0);
    EXPECT_GT(filter.eigenvalues()(2), 0.01);

    Eigen::MatrixXd indicator = Eigen::MatrixXd::Zero(1, 10);
    indicator.leftCols(5).setOnes();
    EXPECT_LT((filter.apply(indicator) - indicator).cwiseAbs().maxCoeff(), 1e-10);
}

TEST(SpectralFilter, AttenuatesWithinClusterContrast) {
    const double rho = 0.001;
    spectral_filter_t filter(two_cluster_laplacian(1.0, 0.1), rho);

    // e1 - e2 lies in the lambda = 5 eigenspace of the two-cluster graph
    Eigen::MatrixXd contrast = Eigen::MatrixXd::Zero(1, 10);
    contrast(0, 1) = 1.0;
    contrast(0, 2) = -1.0;

    const Eigen::MatrixXd filtered = filter.apply(contrast);
    EXPECT_NEAR(filtered.norm(), std::sqrt(rho / 5.0) * contrast.norm(), 1e-10);
}

TEST(SpectralFilter, AcceptsRoundOffAsymmetry) {
    Eigen::MatrixXd laplacian = path_laplacian(5);
    laplacian(0, 1) += 1e-12;

    EXPECT_NO_THROW(spectral_filter_t(laplacian, 0.5));
}

TEST(SpectralFilter, RejectsInvalidCutoff) {
    const Eigen::MatrixXd laplacian = path_laplacian(4);

    EXPECT_THROW(spectral_filter_t(laplacian, 0.0), invalid_parameter_error);
    EXPECT_THROW(spectral_filter_t(laplacian, -1.0), invalid_parameter_error);
    EXPECT_THROW(spectral_filter_t(laplacian, std::numeric_limits<double>::quiet_NaN()),
                 invalid_parameter_error);
    EXPECT_THROW(spectral_filter_t(laplacian, std::numeric_limits<double>::infinity()),
                 invalid_parameter_error);
}

TEST(SpectralFilter, RejectsInvalidLaplacian) {
    EXPECT_THROW(spectral_filter_t(Eigen::MatrixXd(0, 0), 0.5), invalid_graph_error);
    EXPECT_THROW(spectral_filter_t(Eigen::MatrixXd::Zero(3, 4), 0.5), invalid_graph_error);

    Eigen::MatrixXd with_nan = path_laplacian(4);
    with_nan(2, 2) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(spectral_filter_t(with_nan, 0.5), invalid_graph_error);

    Eigen::MatrixXd asymmetric = path_laplacian(4);
    asymmetric(0, 1) = -3.0;
    EXPECT_THROW(spectral_filter_t(asymmetric, 0.5), invalid_graph_error);

    const Eigen::MatrixXd negative_definite = -Eigen::MatrixXd::Identity(3, 3);
    EXPECT_THROW(spectral_filter_t(negative_definite, 0.5), invalid_graph_error);
}

TEST(SpectralFilter, RejectsSignalOfWrongWidth) {
    spectral_filter_t filter(path_laplacian(6), 0.5);
    const Eigen::MatrixXd narrow = Eigen::MatrixXd::Zero(4, 5);

    EXPECT_THROW(filter.apply(narrow), dimension_mismatch_error);
    EXPECT_THROW(filter.gft(narrow), dimension_mismatch_error);
}

TEST(SpectralFilter, InvalidGraphErrorIsAnInvalidArgument) {
    EXPECT_THROW(spectral_filter_t(Eigen::MatrixXd::Zero(2, 3), 0.5), std::invalid_argument);
}

} // namespace gfcpd
