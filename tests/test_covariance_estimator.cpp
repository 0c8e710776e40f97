/**
 * @file test_covariance_estimator.cpp
 * @brief Unit tests for sample covariance and eigenvalue-floor repair
 */

#include <catch2/catch.hpp>
#include "risk/covariance_estimator.hpp"
#include "risk/sample_covariance.hpp"
#include <Eigen/Eigenvalues>

using namespace allocation;
using namespace allocation::risk;
using Catch::Matchers::WithinAbs;

namespace {

double min_eigenvalue(const Eigen::MatrixXd& matrix) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(matrix);
    return solver.eigenvalues().minCoeff();
}

bool is_symmetric(const Eigen::MatrixXd& matrix) {
    return (matrix - matrix.transpose()).cwiseAbs().maxCoeff() == 0.0;
}

} // namespace

TEST_CASE("Sample covariance", "[SampleCovariance]") {
    // Observations in rows, assets in columns
    Eigen::MatrixXd returns(3, 2);
    returns << 0.01, 0.03,
               0.02, 0.02,
               0.03, 0.01;

    SECTION("Bessel-corrected estimate") {
        SampleCovariance model;
        auto cov = model.estimate_covariance(returns);

        REQUIRE(cov.rows() == 2);
        REQUIRE_THAT(cov(0, 0), WithinAbs(1e-4, 1e-12));
        REQUIRE_THAT(cov(1, 1), WithinAbs(1e-4, 1e-12));
        REQUIRE_THAT(cov(0, 1), WithinAbs(-1e-4, 1e-12));
        REQUIRE(is_symmetric(cov));
    }

    SECTION("Population estimate") {
        SampleCovariance model(false);
        auto cov = model.estimate_covariance(returns);
        REQUIRE_THAT(cov(0, 0), WithinAbs(2e-4 / 3.0, 1e-12));
    }

    SECTION("Single observation is rejected") {
        SampleCovariance model;
        REQUIRE_THROWS_AS(model.estimate_covariance(returns.topRows(1)), std::invalid_argument);
    }

    SECTION("Non-finite returns are rejected") {
        SampleCovariance model;
        Eigen::MatrixXd bad = returns;
        bad(1, 1) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(model.estimate_covariance(bad), std::invalid_argument);
    }
}

TEST_CASE("Return matrix construction", "[CovarianceEstimator]") {
    Eigen::VectorXd a(4), b(3);
    a << 0.01, 0.02, 0.03, 0.04;
    b << -0.01, 0.00, 0.01;

    SECTION("Truncates to the shortest series") {
        auto matrix = CovarianceEstimator::build_return_matrix({a, b});

        REQUIRE(matrix.rows() == 2);
        REQUIRE(matrix.cols() == 3);
        REQUIRE_THAT(matrix(0, 2), WithinAbs(0.03, 1e-12));
        REQUIRE_THAT(matrix(1, 0), WithinAbs(-0.01, 1e-12));
    }

    SECTION("Empty inputs") {
        REQUIRE_THROWS_AS(CovarianceEstimator::build_return_matrix({}), std::invalid_argument);
        REQUIRE_THROWS_AS(CovarianceEstimator::build_return_matrix({a, Eigen::VectorXd()}),
                          std::invalid_argument);
    }
}

TEST_CASE("Eigenvalue floor repair", "[CovarianceEstimator][PSD]") {
    SECTION("Indefinite matrix becomes positive definite") {
        Eigen::MatrixXd indefinite(3, 3);
        indefinite << 1.0,  0.9,  0.9,
                      0.9,  1.0, -0.9,
                      0.9, -0.9,  1.0;
        REQUIRE(min_eigenvalue(indefinite) < 0.0);

        CovarianceEstimator estimator(1e-4);
        auto repaired = estimator.repair(indefinite);

        REQUIRE(is_symmetric(repaired));
        REQUIRE(min_eigenvalue(repaired) >= 1e-4 - 1e-10);
    }

    SECTION("Positive definite matrix is preserved") {
        Eigen::MatrixXd cov(3, 3);
        cov << 0.04, 0.02, 0.01,
               0.02, 0.06, 0.02,
               0.01, 0.02, 0.05;

        CovarianceEstimator estimator;
        auto repaired = estimator.repair(cov);

        REQUIRE((repaired - cov).cwiseAbs().maxCoeff() < 1e-12);
    }

    SECTION("Non-square matrix is rejected") {
        CovarianceEstimator estimator;
        REQUIRE_THROWS_AS(estimator.repair(Eigen::MatrixXd::Ones(2, 3)), std::invalid_argument);
    }

    SECTION("Non-positive floor is rejected") {
        REQUIRE_THROWS_AS(CovarianceEstimator(0.0), std::invalid_argument);
    }
}

TEST_CASE("End-to-end covariance estimate", "[CovarianceEstimator]") {
    CovarianceEstimator estimator;

    SECTION("Perfectly anti-correlated assets are singular before repair") {
        // Assets in rows, observations in columns
        Eigen::MatrixXd matrix(2, 3);
        matrix << 0.01, 0.02, 0.03,
                  0.03, 0.02, 0.01;

        auto cov = estimator.estimate(matrix);

        REQUIRE(cov.rows() == 2);
        REQUIRE_THAT(cov(0, 0), WithinAbs(1e-4, 1e-7));
        REQUIRE_THAT(cov(0, 1), WithinAbs(-1e-4, 1e-7));
        REQUIRE(min_eigenvalue(cov) >= 1e-8 - 1e-12);
    }

    SECTION("Single asset") {
        Eigen::MatrixXd matrix(1, 4);
        matrix << 0.01, -0.01, 0.01, -0.01;

        auto cov = estimator.estimate(matrix);

        REQUIRE(cov.rows() == 1);
        REQUIRE_THAT(cov(0, 0), WithinAbs(0.0004 / 3.0, 1e-12));
    }

    SECTION("Default model is the sample estimator") {
        REQUIRE(estimator.model().get_name() == "SampleCovariance");
    }
}
