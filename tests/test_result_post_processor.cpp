/**
 * @file test_result_post_processor.cpp
 * @brief Unit tests for bound enforcement, diversification, risk level and confidence
 */

#include <catch2/catch.hpp>
#include "optimizer/result_post_processor.hpp"
#include <cmath>
#include <limits>

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

namespace {

OptimizerConfig bounds_config(double min_w, double max_w) {
    OptimizerConfig config;
    config.min_position_weight = min_w;
    config.max_position_weight = max_w;
    return config;
}

} // namespace

TEST_CASE("Bound enforcement", "[PostProcessor][Bounds]") {
    SECTION("Weights inside the bounds are only normalized") {
        ResultPostProcessor processor(bounds_config(0.01, 0.6));
        Eigen::VectorXd raw(3);
        raw << 2.0, 1.0, 1.0;

        auto w = processor.enforce_bounds(raw);
        REQUIRE_THAT(w(0), WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(w(1), WithinAbs(0.25, 1e-12));
    }

    SECTION("Infeasible upper bound collapses to equal weights") {
        ResultPostProcessor processor(bounds_config(0.01, 0.20));
        Eigen::VectorXd raw(3);
        raw << 0.5, 0.3, 0.2;

        auto w = processor.enforce_bounds(raw);
        for (Eigen::Index i = 0; i < 3; ++i) {
            REQUIRE_THAT(w(i), WithinAbs(1.0 / 3.0, 1e-12));
        }
    }

    SECTION("Min pass then max pass, each renormalized") {
        ResultPostProcessor processor(bounds_config(0.05, 0.5));
        Eigen::VectorXd raw(3);
        raw << 0.7, 0.29, 0.01;

        auto w = processor.enforce_bounds(raw);

        // (0.7, 0.29, 0.05) / 1.04, then cap at 0.5 and divide by 0.826923...
        REQUIRE_THAT(w.sum(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(w(0), WithinAbs(0.604651, 1e-5));
        REQUIRE_THAT(w(1), WithinAbs(0.337209, 1e-5));
        REQUIRE_THAT(w(2), WithinAbs(0.058140, 1e-5));
    }

    SECTION("Invalid inputs") {
        ResultPostProcessor processor;
        REQUIRE_THROWS_AS(processor.enforce_bounds(Eigen::VectorXd()), std::invalid_argument);
        REQUIRE_THROWS_AS(processor.enforce_bounds(Eigen::VectorXd::Zero(3)), std::invalid_argument);

        Eigen::VectorXd nan_weights = Eigen::VectorXd::Ones(2);
        nan_weights(0) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(processor.enforce_bounds(nan_weights), std::invalid_argument);
    }
}

TEST_CASE("Diversification score", "[PostProcessor][Diversification]") {
    SECTION("Single asset") {
        REQUIRE(ResultPostProcessor::diversification_score(Eigen::VectorXd::Ones(1),
                                                           Eigen::MatrixXd::Identity(1, 1)) == 0.0);
    }

    SECTION("Perfectly correlated, unequal weights") {
        Eigen::VectorXd w(2);
        w << 0.8, 0.2;
        Eigen::MatrixXd cov = Eigen::MatrixXd::Constant(2, 2, 0.04);

        const double entropy = -(0.8 * std::log(0.8) + 0.2 * std::log(0.2));
        REQUIRE_THAT(ResultPostProcessor::diversification_score(w, cov),
                     WithinAbs(entropy / std::log(2.0), 1e-6));
    }

    SECTION("Uncorrelated equal weights are capped at one") {
        Eigen::VectorXd w = Eigen::VectorXd::Constant(4, 0.25);
        REQUIRE_THAT(ResultPostProcessor::diversification_score(w, Eigen::MatrixXd::Identity(4, 4)),
                     WithinAbs(1.0, 1e-12));
    }

    SECTION("Concentrated portfolio") {
        Eigen::VectorXd w = Eigen::VectorXd::Zero(4);
        w(0) = 1.0;
        REQUIRE_THAT(ResultPostProcessor::diversification_score(w, Eigen::MatrixXd::Identity(4, 4)),
                     WithinAbs(0.0, 1e-9));
    }

    SECTION("Zero volatility leaves the entropy term alone") {
        Eigen::VectorXd w = Eigen::VectorXd::Constant(2, 0.5);
        REQUIRE_THAT(ResultPostProcessor::diversification_score(w, Eigen::MatrixXd::Zero(2, 2)),
                     WithinAbs(1.0, 1e-6));
    }
}

TEST_CASE("Risk level classification", "[PostProcessor][RiskLevel]") {
    REQUIRE(ResultPostProcessor::classify_risk(0.0) == RiskLevel::LOW);
    REQUIRE(ResultPostProcessor::classify_risk(0.10) == RiskLevel::LOW);
    REQUIRE(ResultPostProcessor::classify_risk(0.10000001) == RiskLevel::MEDIUM);
    REQUIRE(ResultPostProcessor::classify_risk(0.20) == RiskLevel::MEDIUM);
    REQUIRE(ResultPostProcessor::classify_risk(0.25) == RiskLevel::HIGH);
    REQUIRE(ResultPostProcessor::classify_risk(0.30) == RiskLevel::HIGH);
    REQUIRE(ResultPostProcessor::classify_risk(0.30000001) == RiskLevel::VERY_HIGH);
    REQUIRE(to_string(RiskLevel::VERY_HIGH) == "VERY_HIGH");
}

TEST_CASE("Confidence", "[PostProcessor][Confidence]") {
    ResultPostProcessor processor;

    REQUIRE_THAT(processor.confidence(true, 0), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(processor.confidence(true, 100), WithinAbs(0.95, 1e-12));
    REQUIRE_THAT(processor.confidence(true, 800), WithinAbs(0.75, 1e-12));
    REQUIRE_THAT(processor.confidence(false, 1000), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(processor.confidence(false, 0), WithinAbs(0.75, 1e-12));
}

TEST_CASE("Result finalization", "[PostProcessor]") {
    ResultPostProcessor processor(bounds_config(0.01, 0.5));

    Eigen::VectorXd mu(3);
    mu << 0.10, 0.12, 0.08;
    Eigen::MatrixXd cov(3, 3);
    cov << 0.04, 0.02, 0.01,
           0.02, 0.06, 0.02,
           0.01, 0.02, 0.05;

    WeightSolution solution;
    solution.weights = Eigen::VectorXd(3);
    solution.weights << 0.5, 0.3, 0.2;
    solution.method = OptimizationMethod::MAX_SHARPE;
    solution.iterations = 100;
    solution.converged = true;

    SECTION("Statistics come from the final weights") {
        auto result = processor.finalize(solution, {"AAA", "BBB", "CCC"}, mu, cov);

        REQUIRE(result.weights.size() == 3);
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(result.expected_return, WithinAbs(0.05 + 0.036 + 0.016, 1e-12));

        const double variance = solution.weights.dot(cov * solution.weights);
        REQUIRE_THAT(result.volatility, WithinAbs(std::sqrt(variance), 1e-12));
        REQUIRE_THAT(result.sharpe_ratio, WithinAbs((0.102 - 0.02) / std::sqrt(variance), 1e-10));
        REQUIRE(result.risk_level == ResultPostProcessor::classify_risk(result.volatility));
        REQUIRE_THAT(result.confidence, WithinAbs(0.95, 1e-12));
        REQUIRE(result.method == "max_sharpe");
        REQUIRE(result.convergence);
        REQUIRE_FALSE(result.timestamp.empty());
    }

    SECTION("Risk parity uses a fixed confidence") {
        solution.method = OptimizationMethod::RISK_PARITY;
        auto result = processor.finalize(solution, {"AAA", "BBB", "CCC"}, mu, cov);
        REQUIRE_THAT(result.confidence, WithinAbs(ResultPostProcessor::RISK_PARITY_CONFIDENCE, 1e-12));
    }

    SECTION("Size mismatch") {
        REQUIRE_THROWS_AS(processor.finalize(solution, {"AAA", "BBB"}, mu, cov), std::invalid_argument);
    }
}
