/**
 * @file asset_series.cpp
 * @brief Implementation of ReturnSeriesBuilder
 */

#include "data/asset_series.hpp"
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>

namespace allocation
{
    namespace data
    {

        ReturnSeriesBuilder::ReturnSeriesBuilder(const OptimizerConfig &config)
            : min_price_points_(config.min_price_points),
              trading_days_per_year_(config.trading_days_per_year),
              verbose_(config.verbose)
        {
        }

        std::optional<AssetSeries> ReturnSeriesBuilder::build(const AssetRecord &record) const
        {
            if (static_cast<int>(record.samples.size()) < min_price_points_)
            {
                return std::nullopt;
            }

            std::vector<double> closes;
            closes.reserve(record.samples.size());

            for (const auto &sample : record.samples)
            {
                if (sample.close && std::isfinite(*sample.close) && *sample.close > 0.0)
                {
                    closes.push_back(*sample.close);
                }
            }

            if (static_cast<int>(closes.size()) < min_price_points_)
            {
                return std::nullopt;
            }

            AssetSeries series;
            series.symbol = record.symbol;
            series.returns = log_returns(closes);
            series.volatility = annualized_volatility(series.returns, trading_days_per_year_);
            series.liquidity_score = liquidity_proxy(record);
            series.sector = record.sector;
            series.market_cap = record.market_cap;
            series.closes = std::move(closes);

            return series;
        }

        std::vector<AssetSeries> ReturnSeriesBuilder::build_universe(
            const std::vector<AssetRecord> &records) const
        {
            std::vector<AssetSeries> universe;
            universe.reserve(records.size());
            std::set<std::string> seen;

            for (const auto &record : records)
            {
                auto series = build(record);
                if (!series)
                {
                    continue;
                }

                if (!seen.insert(series->symbol).second)
                {
                    if (verbose_)
                    {
                        std::cerr << "Warning: duplicate symbol " << series->symbol
                                  << " ignored\n";
                    }
                    continue;
                }

                universe.push_back(std::move(*series));
            }

            return universe;
        }

        Eigen::VectorXd ReturnSeriesBuilder::log_returns(const std::vector<double> &prices)
        {
            if (prices.size() < 2)
            {
                return Eigen::VectorXd();
            }

            Eigen::VectorXd returns(static_cast<Eigen::Index>(prices.size() - 1));

            for (size_t i = 1; i < prices.size(); ++i)
            {
                if (prices[i] <= 0.0 || prices[i - 1] <= 0.0)
                {
                    throw std::invalid_argument(
                        "Log-returns require positive prices, got: " +
                        std::to_string(prices[i - 1]) + " -> " + std::to_string(prices[i]));
                }
                returns(static_cast<Eigen::Index>(i - 1)) = std::log(prices[i]) - std::log(prices[i - 1]);
            }

            return returns;
        }

        double ReturnSeriesBuilder::annualized_volatility(const Eigen::VectorXd &returns,
                                                          int trading_days_per_year)
        {
            const Eigen::Index n = returns.size();
            if (n < 2)
            {
                return 0.0;
            }

            double mean = returns.mean();
            double sum_sq = (returns.array() - mean).square().sum();
            double daily_vol = std::sqrt(sum_sq / static_cast<double>(n));

            return daily_vol * std::sqrt(static_cast<double>(trading_days_per_year));
        }

        double ReturnSeriesBuilder::liquidity_proxy(const AssetRecord &record) const
        {
            double total = 0.0;
            int count = 0;

            for (const auto &sample : record.samples)
            {
                if (sample.volume && std::isfinite(*sample.volume) && *sample.volume != 0.0)
                {
                    total += *sample.volume;
                    ++count;
                }
            }

            if (count >= min_price_points_)
            {
                return total / static_cast<double>(count);
            }

            return record.liquidity_score.value_or(0.0);
        }

    } // namespace data
} // namespace allocation
