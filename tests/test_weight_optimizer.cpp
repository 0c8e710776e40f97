/**
 * @file test_weight_optimizer.cpp
 * @brief Unit tests for WeightOptimizer objective profiles
 */

#include <catch2/catch.hpp>
#include "optimizer/weight_optimizer.hpp"
#include <cmath>
#include <limits>

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class WeightOptimizerFixture
{
protected:
    Eigen::VectorXd returns_;
    Eigen::MatrixXd cov_;
    OptimizerConfig config_;
    OptimizationConstraints constraints_;

    WeightOptimizerFixture()
    {
        returns_ = Eigen::VectorXd(3);
        returns_ << 0.10, 0.12, 0.08;

        cov_ = Eigen::MatrixXd(3, 3);
        cov_ << 0.04, 0.02, 0.01,
                0.02, 0.06, 0.02,
                0.01, 0.02, 0.05;

        config_.risk_free_rate = 0.02;
        config_.max_position_weight = 0.5;
        config_.min_position_weight = 0.01;

        constraints_.min_weight = 0.01;
        constraints_.max_weight = 0.5;
    }

    void require_feasible(const WeightSolution& solution, double min_w, double max_w) const
    {
        OptimizationConstraints bounds;
        bounds.min_weight = min_w;
        bounds.max_weight = max_w;
        REQUIRE(OptimizerInterface::check_constraints(solution.weights, bounds, 1e-8));
    }
};

// ============================================================================
// Max Sharpe
// ============================================================================

TEST_CASE_METHOD(WeightOptimizerFixture, "Max Sharpe three-asset portfolio", "[WeightOptimizer][MaxSharpe]") {
    WeightOptimizer optimizer(OptimizationMethod::MAX_SHARPE, config_);
    auto solution = optimizer.optimize(returns_, cov_, constraints_);

    REQUIRE(solution.converged);
    REQUIRE(solution.method == OptimizationMethod::MAX_SHARPE);
    require_feasible(solution, 0.01, 0.5);

    REQUIRE_THAT(solution.weights(0), WithinAbs(0.464, 0.01));
    REQUIRE_THAT(solution.weights(1), WithinAbs(0.360, 0.01));
    REQUIRE_THAT(solution.weights(2), WithinAbs(0.176, 0.01));

    // Beats the equal-weight Sharpe of 0.48
    REQUIRE(solution.sharpe_ratio >= 0.49);
    REQUIRE_THAT(solution.sharpe_ratio, WithinAbs(0.4932, 0.001));

    SECTION("Statistics agree with the weights") {
        REQUIRE_THAT(solution.expected_return, WithinAbs(solution.weights.dot(returns_), 1e-12));
        REQUIRE_THAT(solution.volatility,
                     WithinAbs(std::sqrt(solution.weights.dot(cov_ * solution.weights)), 1e-12));
    }

    SECTION("Deterministic across runs") {
        auto again = optimizer.optimize(returns_, cov_, constraints_);
        REQUIRE((again.weights - solution.weights).cwiseAbs().maxCoeff() == 0.0);
        REQUIRE(again.iterations == solution.iterations);
    }
}

TEST_CASE_METHOD(WeightOptimizerFixture, "Infeasible bounds keep the equal-weight guess", "[WeightOptimizer][Infeasible]") {
    // 3 * 0.20 < 1: no weight vector satisfies the bounds
    OptimizationConstraints tight;
    tight.min_weight = 0.01;
    tight.max_weight = 0.20;

    WeightOptimizer optimizer(OptimizationMethod::MAX_SHARPE, config_);
    auto solution = optimizer.optimize(returns_, cov_, tight);

    REQUIRE_FALSE(solution.converged);
    REQUIRE(solution.iterations == 0);
    for (Eigen::Index i = 0; i < 3; ++i) {
        REQUIRE_THAT(solution.weights(i), WithinAbs(1.0 / 3.0, 1e-12));
    }
}

TEST_CASE("Negative Sharpe objective", "[WeightOptimizer][MaxSharpe]") {
    Eigen::VectorXd w = Eigen::VectorXd::Constant(2, 0.5);
    Eigen::VectorXd mu(2);
    mu << 0.1, 0.2;

    SECTION("Zero volatility") {
        double value = WeightOptimizer::negative_sharpe(w, mu, Eigen::MatrixXd::Zero(2, 2), 0.02);
        REQUIRE(std::isinf(value));
        REQUIRE(value < 0.0);
    }

    SECTION("Ordinary portfolio") {
        Eigen::MatrixXd cov = Eigen::MatrixXd::Identity(2, 2) * 0.08;
        // vol = sqrt(0.5 * 0.08) = 0.2
        REQUIRE_THAT(WeightOptimizer::negative_sharpe(w, mu, cov, 0.03), WithinAbs(-0.6, 1e-12));
    }
}

// ============================================================================
// Mean Variance
// ============================================================================

TEST_CASE_METHOD(WeightOptimizerFixture, "Minimum variance portfolio", "[WeightOptimizer][MeanVariance]") {
    config_.max_iterations = 10000;
    config_.tolerance = 1e-7;
    WeightOptimizer optimizer(OptimizationMethod::MEAN_VARIANCE, config_);

    SECTION("Without a target return") {
        auto solution = optimizer.optimize(returns_, cov_, constraints_);

        REQUIRE(solution.converged);
        require_feasible(solution, 0.01, 0.5);
        REQUIRE_THAT(solution.weights(0), WithinAbs(16.0 / 33.0, 1e-3));
        REQUIRE_THAT(solution.weights(1), WithinAbs(5.0 / 33.0, 1e-3));
        REQUIRE_THAT(solution.weights(2), WithinAbs(12.0 / 33.0, 1e-3));
        REQUIRE_THAT(solution.objective_value, WithinAbs(solution.volatility * solution.volatility, 1e-12));
    }

    SECTION("With a target return") {
        constraints_.target_return = 0.105;
        auto solution = optimizer.optimize(returns_, cov_, constraints_);

        REQUIRE(solution.converged);
        REQUIRE_THAT(solution.expected_return, WithinAbs(0.105, 1e-4));
        REQUIRE_THAT(solution.weights(0), WithinAbs(0.4605, 2e-3));
        REQUIRE_THAT(solution.weights(1), WithinAbs(0.3947, 2e-3));
        REQUIRE_THAT(solution.weights(2), WithinAbs(0.1447, 2e-3));
    }

    SECTION("Unreachable target return") {
        constraints_.target_return = 0.5;
        auto solution = optimizer.optimize(returns_, cov_, constraints_);

        REQUIRE_FALSE(solution.converged);
        REQUIRE(solution.weights.allFinite());
    }

    SECTION("Infeasible bounds") {
        OptimizationConstraints tight;
        tight.max_weight = 0.2;
        auto solution = optimizer.optimize(returns_, cov_, tight);

        REQUIRE_FALSE(solution.converged);
        REQUIRE(solution.iterations == 0);
        REQUIRE_THAT(solution.weights(1), WithinAbs(1.0 / 3.0, 1e-12));
    }
}

// ============================================================================
// Black-Litterman
// ============================================================================

TEST_CASE_METHOD(WeightOptimizerFixture, "Black-Litterman equilibrium tilt", "[WeightOptimizer][BlackLitterman]") {
    WeightOptimizer optimizer(OptimizationMethod::BLACK_LITTERMAN, config_);
    auto solution = optimizer.optimize(returns_, cov_, constraints_);

    REQUIRE(solution.method == OptimizationMethod::BLACK_LITTERMAN);
    REQUIRE(solution.converged);
    require_feasible(solution, 0.01, 0.5);

    // Equilibrium returns 3 * Sigma * (1/3, 1/3, 1/3)
    REQUIRE(solution.return_vector.size() == 3);
    REQUIRE_THAT(solution.return_vector(0), WithinAbs(0.07, 1e-12));
    REQUIRE_THAT(solution.return_vector(1), WithinAbs(0.10, 1e-12));
    REQUIRE_THAT(solution.return_vector(2), WithinAbs(0.08, 1e-12));

    REQUIRE_THAT(solution.weights(0), WithinAbs(0.281, 0.01));
    REQUIRE_THAT(solution.weights(1), WithinAbs(0.396, 0.01));
    REQUIRE_THAT(solution.weights(2), WithinAbs(0.323, 0.01));
}

TEST_CASE_METHOD(WeightOptimizerFixture, "Black-Litterman market weights", "[WeightOptimizer][BlackLitterman]") {
    SECTION("Negative market weight is rejected") {
        Eigen::VectorXd market(3);
        market << 0.5, 0.6, -0.1;
        REQUIRE_THROWS_AS(WeightOptimizer(OptimizationMethod::BLACK_LITTERMAN, config_, market),
                          std::invalid_argument);
    }

    SECTION("Parameters expose the market portfolio") {
        Eigen::VectorXd market(3);
        market << 0.5, 0.3, 0.2;
        WeightOptimizer optimizer(OptimizationMethod::BLACK_LITTERMAN, config_, market);

        auto params = optimizer.get_parameters();
        REQUIRE(params["method"] == "black_litterman");
        REQUIRE(params["market_weights"].size() == 3);
        REQUIRE(optimizer.get_name() == "WeightOptimizer(black_litterman)");
    }
}

// ============================================================================
// Risk Parity and Equal Risk Contribution
// ============================================================================

TEST_CASE_METHOD(WeightOptimizerFixture, "Inverse-volatility risk parity", "[WeightOptimizer][RiskParity]") {
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(3, 3);
    cov.diagonal() << 0.04, 0.09, 0.01;

    WeightOptimizer optimizer(OptimizationMethod::RISK_PARITY, config_);
    auto solution = optimizer.optimize(returns_, cov, constraints_);

    REQUIRE(solution.converged);
    REQUIRE(solution.iterations == 1);
    REQUIRE_THAT(solution.weights(0), WithinAbs(3.0 / 11.0, 1e-12));
    REQUIRE_THAT(solution.weights(1), WithinAbs(2.0 / 11.0, 1e-12));
    REQUIRE_THAT(solution.weights(2), WithinAbs(6.0 / 11.0, 1e-12));

    SECTION("Zero variance is rejected") {
        cov(2, 2) = 0.0;
        REQUIRE_THROWS_AS(optimizer.optimize(returns_, cov, constraints_), std::invalid_argument);
    }
}

TEST_CASE_METHOD(WeightOptimizerFixture, "Equal risk contribution", "[WeightOptimizer][ERC]") {
    WeightOptimizer optimizer(OptimizationMethod::EQUAL_RISK_CONTRIBUTION, config_);

    SECTION("Correlated assets") {
        auto solution = optimizer.optimize(returns_, cov_, constraints_);

        REQUIRE(solution.converged);
        require_feasible(solution, 0.01, 0.5);

        auto contributions = WeightOptimizer::risk_contributions(solution.weights, cov_);
        REQUIRE(contributions.maxCoeff() - contributions.minCoeff() < 1e-4);
        REQUIRE_THAT(contributions.sum(), WithinAbs(solution.volatility, 1e-10));
    }

    SECTION("Uncorrelated assets match inverse volatility") {
        Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(3, 3);
        cov.diagonal() << 0.04, 0.09, 0.01;
        constraints_.min_weight = 0.0;
        constraints_.max_weight = 1.0;

        auto solution = optimizer.optimize(returns_, cov, constraints_);

        REQUIRE(solution.converged);
        REQUIRE_THAT(solution.weights(0), WithinAbs(3.0 / 11.0, 2e-3));
        REQUIRE_THAT(solution.weights(1), WithinAbs(2.0 / 11.0, 2e-3));
        REQUIRE_THAT(solution.weights(2), WithinAbs(6.0 / 11.0, 2e-3));
    }
}

// ============================================================================
// Input Validation
// ============================================================================

TEST_CASE_METHOD(WeightOptimizerFixture, "Input validation", "[WeightOptimizer][Validation]") {
    WeightOptimizer optimizer(OptimizationMethod::MAX_SHARPE, config_);

    SECTION("Dimension mismatch") {
        REQUIRE_THROWS_AS(optimizer.optimize(returns_.head(2), cov_, constraints_), std::invalid_argument);
    }

    SECTION("NaN expected return") {
        returns_(1) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(optimizer.optimize(returns_, cov_, constraints_), std::invalid_argument);
    }

    SECTION("Asymmetric covariance") {
        cov_(0, 1) = 0.03;
        REQUIRE_THROWS_AS(optimizer.optimize(returns_, cov_, constraints_), std::invalid_argument);
    }

    SECTION("Min weight above max weight") {
        constraints_.min_weight = 0.6;
        REQUIRE_THROWS_AS(optimizer.optimize(returns_, cov_, constraints_), std::invalid_argument);
    }
}

TEST_CASE("Constraint check", "[WeightOptimizer][Validation]") {
    OptimizationConstraints bounds;
    bounds.min_weight = 0.1;
    bounds.max_weight = 0.5;

    Eigen::VectorXd w(3);

    SECTION("Inside the bounds") {
        w << 0.5, 0.3, 0.2;
        REQUIRE(OptimizerInterface::check_constraints(w, bounds));
    }

    SECTION("Above the upper bound") {
        w << 0.6, 0.3, 0.1;
        REQUIRE_FALSE(OptimizerInterface::check_constraints(w, bounds));
    }

    SECTION("Below the lower bound") {
        w << 0.5, 0.45, 0.05;
        REQUIRE_FALSE(OptimizerInterface::check_constraints(w, bounds));
    }

    SECTION("Budget not met") {
        w << 0.3, 0.3, 0.3;
        REQUIRE_FALSE(OptimizerInterface::check_constraints(w, bounds));
        REQUIRE(OptimizerInterface::check_constraints(w, bounds, 0.2));
    }
}

TEST_CASE("Method names", "[WeightOptimizer]") {
    REQUIRE(method_from_string("MAX_SHARPE") == OptimizationMethod::MAX_SHARPE);
    REQUIRE(method_from_string("min_variance") == OptimizationMethod::MEAN_VARIANCE);
    REQUIRE(method_from_string("risk_parity") == OptimizationMethod::RISK_PARITY);
    REQUIRE(method_from_string("equal_risk_contribution") == OptimizationMethod::EQUAL_RISK_CONTRIBUTION);
    REQUIRE(method_from_string("something_else") == OptimizationMethod::MAX_SHARPE);
    REQUIRE(to_string(OptimizationMethod::BLACK_LITTERMAN) == "black_litterman");
}
