/**
 * @file asset_series.hpp
 * @brief Per-asset price history and derived return series
 *
 * Converts raw per-asset (close, volume) samples into log-return vectors,
 * annualized volatility and a liquidity proxy. Assets with too few valid
 * closes are excluded from the optimization universe.
 */

#ifndef ALLOCATION_DATA_ASSET_SERIES_HPP
#define ALLOCATION_DATA_ASSET_SERIES_HPP

#include "core/config.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace allocation
{
    namespace data
    {

        /**
         * @struct PriceSample
         * @brief One observation of an asset; either field may be missing
         */
        struct PriceSample
        {
            std::optional<double> close;  ///< Closing price (nullopt = missing)
            std::optional<double> volume; ///< Traded volume (nullopt = missing)
        };

        /**
         * @struct AssetRecord
         * @brief Raw input record supplied by the data-ingestion side
         *
         * Samples are chronological. Metadata fields are optional and only
         * carried through to the derived series.
         */
        struct AssetRecord
        {
            std::string symbol;
            std::vector<PriceSample> samples;
            std::string sector = "Unknown";
            double market_cap = 0.0;
            std::optional<double> liquidity_score; ///< Precomputed liquidity, if any
        };

        /**
         * @struct AssetSeries
         * @brief Validated price history with derived statistics
         */
        struct AssetSeries
        {
            std::string symbol;
            std::vector<double> closes; ///< Valid closes, chronological
            Eigen::VectorXd returns;    ///< Log-returns, size = closes.size() - 1
            double volatility = 0.0;    ///< Annualized volatility of log-returns
            double liquidity_score = 0.0;
            std::string sector = "Unknown";
            double market_cap = 0.0;

            /** @brief Most recent valid close */
            double last_price() const { return closes.back(); }
        };

        /**
         * @class ReturnSeriesBuilder
         * @brief Builds AssetSeries from raw records
         *
         * A close is valid when present, finite and strictly positive. Records
         * with fewer than min_price_points raw samples or valid closes are
         * dropped (not an error).
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class ReturnSeriesBuilder
        {
        public:
            explicit ReturnSeriesBuilder(const OptimizerConfig &config = OptimizerConfig());

            /**
             * @brief Build the series for one record
             * @return The derived series, or nullopt if the record has too few valid closes
             */
            std::optional<AssetSeries> build(const AssetRecord &record) const;

            /**
             * @brief Build every admissible series, preserving input order
             *
             * Later records repeating an already accepted symbol are dropped.
             * An empty result is returned as-is; callers map it to a neutral result.
             */
            std::vector<AssetSeries> build_universe(const std::vector<AssetRecord> &records) const;

            /**
             * @brief Log-returns log(p_t) - log(p_{t-1})
             * @throws std::invalid_argument if any price is non-positive
             */
            static Eigen::VectorXd log_returns(const std::vector<double> &prices);

            /**
             * @brief Population standard deviation (divide by n) scaled by sqrt(trading days)
             * @return 0.0 when fewer than two returns are available
             */
            static double annualized_volatility(const Eigen::VectorXd &returns,
                                                int trading_days_per_year = 252);

        private:
            int min_price_points_;
            int trading_days_per_year_;
            bool verbose_;

            /**
             * @brief Mean of present non-zero volumes, or the record's fallback
             */
            double liquidity_proxy(const AssetRecord &record) const;
        };

    } // namespace data
} // namespace allocation

#endif // ALLOCATION_DATA_ASSET_SERIES_HPP
