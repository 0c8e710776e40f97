/**
 * @file test_portfolio_optimizer.cpp
 * @brief Integration tests for the PortfolioOptimizer pipeline
 */

#include <catch2/catch.hpp>
#include "optimizer/portfolio_optimizer.hpp"
#include "optimizer/expected_returns.hpp"
#include "optimizer/result_post_processor.hpp"
#include "data/data_loader.hpp"
#include "risk/covariance_estimator.hpp"
#include <cmath>

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class PipelineFixture
{
protected:
    OptimizerConfig config_;
    std::vector<data::AssetRecord> records_;

    PipelineFixture()
    {
        config_.max_position_weight = 0.5;
        config_.min_position_weight = 0.01;
        records_ = data::DataLoader::generate_synthetic_records({"AAA", "BBB", "CCC", "DDD"}, 250);
    }

    // Return matrix, covariance and risk-adjusted returns as the pipeline builds them
    void pipeline_inputs(Eigen::MatrixXd& return_matrix, Eigen::MatrixXd& covariance, Eigen::VectorXd& mu) const
    {
        data::ReturnSeriesBuilder builder(config_);
        auto universe = builder.build_universe(records_);

        std::vector<Eigen::VectorXd> returns;
        Eigen::VectorXd volatilities(static_cast<Eigen::Index>(universe.size()));
        for (size_t i = 0; i < universe.size(); ++i) {
            returns.push_back(universe[i].returns);
            volatilities(static_cast<Eigen::Index>(i)) = universe[i].volatility;
        }

        return_matrix = risk::CovarianceEstimator::build_return_matrix(returns);
        covariance = risk::CovarianceEstimator(config_.eigenvalue_floor).estimate(return_matrix);
        mu = ExpectedReturnEstimator(config_).historical_risk_adjusted(return_matrix, volatilities);
    }

    OptimizationRequest request(OptimizationMethod method) const
    {
        OptimizationRequest req;
        req.assets = records_;
        req.method = method;
        return req;
    }
};

// ============================================================================
// Neutral Outcomes
// ============================================================================

TEST_CASE("Empty universe yields the neutral result", "[PortfolioOptimizer][Neutral]") {
    PortfolioOptimizer optimizer;

    OptimizationRequest req;
    auto outcome = optimizer.optimize(req);

    REQUIRE(outcome.status == OutcomeStatus::INSUFFICIENT_DATA);
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.result.weights.empty());
    REQUIRE(outcome.result.sharpe_ratio == 0.0);
    REQUIRE(outcome.result.expected_return == 0.0);
    REQUIRE(outcome.result.confidence == 0.0);
    REQUIRE_FALSE(outcome.result.convergence);
    REQUIRE(outcome.result.method == "max_sharpe");
    REQUIRE_FALSE(outcome.sharpe_improvement.target_achieved);
}

TEST_CASE("Assets without enough prices are dropped", "[PortfolioOptimizer][Neutral]") {
    data::AssetRecord short_history;
    short_history.symbol = "AAA";
    short_history.samples = {data::PriceSample{100.0, 1.0}, data::PriceSample{101.0, 1.0}};

    data::AssetRecord missing_prices;
    missing_prices.symbol = "BBB";
    missing_prices.samples = {data::PriceSample{std::nullopt, 1.0},
                              data::PriceSample{std::nullopt, 1.0},
                              data::PriceSample{50.0, 1.0}};

    OptimizationRequest req;
    req.assets = {short_history, missing_prices};
    req.method = OptimizationMethod::RISK_PARITY;

    auto outcome = PortfolioOptimizer().optimize(req);

    REQUIRE(outcome.status == OutcomeStatus::INSUFFICIENT_DATA);
    REQUIRE(outcome.result.method == "risk_parity");
}

// ============================================================================
// Full Pipeline
// ============================================================================

TEST_CASE_METHOD(PipelineFixture, "Every method produces a valid allocation", "[PortfolioOptimizer]") {
    PortfolioOptimizer optimizer(config_);

    const std::vector<OptimizationMethod> methods = {
        OptimizationMethod::MAX_SHARPE,
        OptimizationMethod::MEAN_VARIANCE,
        OptimizationMethod::BLACK_LITTERMAN,
        OptimizationMethod::RISK_PARITY,
        OptimizationMethod::EQUAL_RISK_CONTRIBUTION
    };

    for (auto method : methods) {
        auto outcome = optimizer.optimize(request(method));
        const auto& result = outcome.result;

        REQUIRE(outcome.status == OutcomeStatus::OPTIMIZED);
        REQUIRE(result.method == to_string(method));
        REQUIRE(result.weights.size() == 4);
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-9));
        REQUIRE(result.volatility > 0.0);
        REQUIRE(result.diversification_score >= 0.0);
        REQUIRE(result.diversification_score <= 1.0);
        REQUIRE(result.confidence >= 0.5);
        REQUIRE(result.confidence <= 1.0);
        REQUIRE(result.risk_level == ResultPostProcessor::classify_risk(result.volatility));

        REQUIRE_THAT(outcome.sharpe_improvement.optimized_sharpe, WithinAbs(result.sharpe_ratio, 1e-12));
        REQUIRE_THAT(outcome.sharpe_improvement.target, WithinAbs(0.20, 1e-12));
    }
}

TEST_CASE_METHOD(PipelineFixture, "Max Sharpe allocation respects the bounds", "[PortfolioOptimizer][MaxSharpe]") {
    PortfolioOptimizer optimizer(config_);
    auto outcome = optimizer.optimize(request(OptimizationMethod::MAX_SHARPE));

    REQUIRE(outcome.ok());
    for (const auto& symbol : outcome.result.weights.symbols()) {
        REQUIRE(outcome.result.weights.weight(symbol) >= 0.01 - 1e-6);
        REQUIRE(outcome.result.weights.weight(symbol) <= 0.5 + 1e-6);
    }

    SECTION("Repeated runs are identical") {
        auto again = optimizer.optimize(request(OptimizationMethod::MAX_SHARPE));
        REQUIRE((again.result.weights.values() - outcome.result.weights.values()).cwiseAbs().maxCoeff() == 0.0);
    }

    SECTION("JSON report") {
        auto j = outcome.to_json();
        REQUIRE(j["status"] == "OPTIMIZED");
        REQUIRE(j["result"]["weights"].size() == 4);
        REQUIRE(j.contains("sharpe_improvement"));
    }
}

TEST_CASE_METHOD(PipelineFixture, "Default bounds are infeasible for three assets", "[PortfolioOptimizer][Infeasible]") {
    // 3 * 0.20 < 1
    PortfolioOptimizer optimizer;
    OptimizationRequest req = request(OptimizationMethod::MAX_SHARPE);
    req.assets.resize(3);

    auto outcome = optimizer.optimize(req);

    REQUIRE(outcome.status == OutcomeStatus::OPTIMIZED);
    REQUIRE_FALSE(outcome.result.convergence);
    REQUIRE(outcome.result.iterations == 0);
    for (const auto& symbol : outcome.result.weights.symbols()) {
        REQUIRE_THAT(outcome.result.weights.weight(symbol), WithinAbs(1.0 / 3.0, 1e-12));
    }
}

TEST_CASE_METHOD(PipelineFixture, "Duplicate symbols keep the first record", "[PortfolioOptimizer]") {
    OptimizationRequest req = request(OptimizationMethod::RISK_PARITY);
    data::AssetRecord duplicate = req.assets.front();
    duplicate.samples.resize(10);
    req.assets.push_back(duplicate);

    auto outcome = PortfolioOptimizer(config_).optimize(req);

    REQUIRE(outcome.ok());
    REQUIRE(outcome.result.weights.size() == 4);
}

TEST_CASE_METHOD(PipelineFixture, "Black-Litterman market weights", "[PortfolioOptimizer][BlackLitterman]") {
    PortfolioOptimizer optimizer(config_);
    OptimizationRequest req = request(OptimizationMethod::BLACK_LITTERMAN);

    SECTION("Market portfolio over the universe") {
        req.market_weights = {{"AAA", 4.0}, {"BBB", 3.0}, {"CCC", 2.0}, {"DDD", 1.0}};
        auto outcome = optimizer.optimize(req);

        REQUIRE(outcome.ok());
        REQUIRE(outcome.result.method == "black_litterman");

        // Market weights applied to the historical annualized mean returns
        Eigen::MatrixXd return_matrix, covariance;
        Eigen::VectorXd mu;
        pipeline_inputs(return_matrix, covariance, mu);
        Eigen::VectorXd market(4);
        market << 0.4, 0.3, 0.2, 0.1;
        const double implied = market.dot(ExpectedReturnEstimator(config_).annualized_means(return_matrix));

        REQUIRE(outcome.message.find("market-implied return " + std::to_string(implied)) != std::string::npos);
    }

    SECTION("Market portfolio outside the universe fails without throwing") {
        req.market_weights = {{"ZZZ", 1.0}};
        auto outcome = optimizer.optimize(req);

        REQUIRE(outcome.status == OutcomeStatus::FAILED);
        REQUIRE(outcome.result.weights.empty());
        REQUIRE_FALSE(outcome.message.empty());
    }
}

TEST_CASE_METHOD(PipelineFixture, "Mean-variance target return", "[PortfolioOptimizer][MeanVariance]") {
    config_.max_iterations = 10000;
    PortfolioOptimizer optimizer(config_);

    OptimizationRequest req = request(OptimizationMethod::MEAN_VARIANCE);
    auto unconstrained = optimizer.optimize(req);
    REQUIRE(unconstrained.ok());

    req.target_return = unconstrained.result.expected_return;
    auto targeted = optimizer.optimize(req);

    REQUIRE(targeted.ok());
    REQUIRE_THAT(targeted.result.expected_return, WithinAbs(unconstrained.result.expected_return, 1e-3));
}

// ============================================================================
// Sharpe Improvement Baseline
// ============================================================================

TEST_CASE_METHOD(PipelineFixture, "Sharpe improvement baseline", "[PortfolioOptimizer][SharpeImprovement]") {
    PortfolioOptimizer optimizer(config_);

    Eigen::MatrixXd return_matrix, covariance;
    Eigen::VectorXd mu;
    pipeline_inputs(return_matrix, covariance, mu);

    const Eigen::VectorXd equal = Eigen::VectorXd::Constant(4, 0.25);
    const double equal_sharpe =
        (equal.dot(mu) - config_.risk_free_rate) / std::sqrt(equal.dot(covariance * equal));

    SECTION("Equal weights without current holdings") {
        auto outcome = optimizer.optimize(request(OptimizationMethod::MAX_SHARPE));

        REQUIRE(outcome.ok());
        REQUIRE_THAT(outcome.sharpe_improvement.baseline_sharpe, WithinAbs(equal_sharpe, 1e-10));
    }

    SECTION("Current holdings") {
        OptimizationRequest req = request(OptimizationMethod::MAX_SHARPE);
        req.current_weights = {{"AAA", 1.0}};
        auto outcome = optimizer.optimize(req);

        const double held_sharpe = (mu(0) - config_.risk_free_rate) / std::sqrt(covariance(0, 0));

        REQUIRE(outcome.ok());
        REQUIRE_THAT(outcome.sharpe_improvement.baseline_sharpe, WithinAbs(held_sharpe, 1e-10));
    }

    SECTION("Holdings are renormalized over the universe") {
        OptimizationRequest req = request(OptimizationMethod::MAX_SHARPE);
        req.current_weights = {{"AAA", 2.0}, {"BBB", 2.0}, {"CCC", 2.0}, {"DDD", 2.0}, {"ZZZ", 5.0}};
        auto outcome = optimizer.optimize(req);

        REQUIRE(outcome.ok());
        REQUIRE_THAT(outcome.sharpe_improvement.baseline_sharpe, WithinAbs(equal_sharpe, 1e-10));
    }

    SECTION("Holdings outside the universe fall back to equal weights") {
        OptimizationRequest req = request(OptimizationMethod::MAX_SHARPE);
        req.current_weights = {{"ZZZ", 1.0}};
        auto outcome = optimizer.optimize(req);

        REQUIRE(outcome.ok());
        REQUIRE_THAT(outcome.sharpe_improvement.baseline_sharpe, WithinAbs(equal_sharpe, 1e-10));
    }
}

// ============================================================================
// Risk Metrics
// ============================================================================

TEST_CASE_METHOD(PipelineFixture, "Risk metrics of the optimized weights", "[PortfolioOptimizer][RiskMetrics]") {
    PortfolioOptimizer optimizer(config_);
    auto outcome = optimizer.optimize(request(OptimizationMethod::EQUAL_RISK_CONTRIBUTION));
    REQUIRE(outcome.ok());

    SECTION("Full history") {
        auto metrics = optimizer.evaluate_risk(outcome.result.weights, records_);

        REQUIRE(metrics.volatility > 0.0);
        REQUIRE(metrics.var_95 < 0.0);
        REQUIRE(metrics.cvar_95 <= metrics.var_95);
        REQUIRE(metrics.max_drawdown <= 0.0);
        REQUIRE(metrics.beta == 1.0);
    }

    SECTION("With a benchmark series") {
        auto bench_records = data::DataLoader::generate_synthetic_records({"BENCH"}, 250, 99);
        data::ReturnSeriesBuilder builder(config_);
        auto bench = builder.build(bench_records.front());
        REQUIRE(bench.has_value());

        std::vector<double> benchmark(bench->returns.data(), bench->returns.data() + bench->returns.size());
        auto metrics = optimizer.evaluate_risk(outcome.result.weights, records_, benchmark);

        REQUIRE(metrics.beta != 1.0);
    }

    SECTION("Missing symbol gives neutral metrics") {
        std::vector<data::AssetRecord> partial(records_.begin(), records_.begin() + 2);
        auto metrics = optimizer.evaluate_risk(outcome.result.weights, partial);

        REQUIRE(metrics.volatility == 0.0);
        REQUIRE(metrics.beta == 1.0);
    }

    SECTION("Empty weights give neutral metrics") {
        auto metrics = optimizer.evaluate_risk(WeightVector(), records_);
        REQUIRE(metrics.volatility == 0.0);
    }
}

TEST_CASE("Invalid configuration is rejected", "[PortfolioOptimizer]") {
    OptimizerConfig config;
    config.max_iterations = -1;
    REQUIRE_THROWS_AS(PortfolioOptimizer(config), std::invalid_argument);
}
