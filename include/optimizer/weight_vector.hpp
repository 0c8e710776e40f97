/**
 * @file weight_vector.hpp
 * @brief Symbol-keyed, universe-ordered portfolio weights
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class WeightVector
         * @brief Validated weight vector keyed by asset symbol
         *
         * The constructor checks that symbols are unique and match the weights
         * in number, that weights are finite, non-negative and have a positive
         * sum, then normalizes them to sum to 1. A default-constructed
         * WeightVector is empty (the neutral allocation).
         *
         * Usage Example:
         * @code
         * WeightVector w({"AAA", "BBB"}, Eigen::Vector2d(3.0, 1.0));
         * double a = w.weight("AAA"); // 0.75
         * @endcode
         */
        class WeightVector
        {
        public:
            WeightVector() = default;

            /**
             * @throws std::invalid_argument if any invariant is violated
             */
            WeightVector(std::vector<std::string> symbols, const Eigen::VectorXd &weights);

            size_t size() const { return symbols_.size(); }
            bool empty() const { return symbols_.empty(); }

            const std::vector<std::string> &symbols() const { return symbols_; }
            const Eigen::VectorXd &values() const { return weights_; }

            bool contains(const std::string &symbol) const;

            /**
             * @brief Weight of the given symbol
             * @throws std::out_of_range if the symbol is not part of the vector
             */
            double weight(const std::string &symbol) const;

            double sum() const { return weights_.sum(); }

            /**
             * @brief Array of {"symbol": ..., "weight": ...} in universe order
             */
            nlohmann::json to_json() const;

        private:
            std::vector<std::string> symbols_;
            Eigen::VectorXd weights_;
        };

    } // namespace optimizer
} // namespace allocation
