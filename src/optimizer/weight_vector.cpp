/**
 * @file weight_vector.cpp
 * @brief Implementation of WeightVector
 */

#include "optimizer/weight_vector.hpp"
#include <set>
#include <utility>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        WeightVector::WeightVector(std::vector<std::string> symbols, const Eigen::VectorXd &weights)
            : symbols_(std::move(symbols)), weights_(weights)
        {
            if (static_cast<Eigen::Index>(symbols_.size()) != weights_.size())
            {
                throw std::invalid_argument(
                    "Symbol count (" + std::to_string(symbols_.size()) +
                    ") does not match weight count (" + std::to_string(weights_.size()) + ")");
            }

            if (symbols_.empty())
            {
                return;
            }

            std::set<std::string> unique(symbols_.begin(), symbols_.end());
            if (unique.size() != symbols_.size())
            {
                throw std::invalid_argument("Weight vector contains duplicate symbols");
            }

            if (!weights_.allFinite())
            {
                throw std::invalid_argument("Weights contain NaN or Inf values");
            }

            if ((weights_.array() < 0.0).any())
            {
                throw std::invalid_argument("Weights must be non-negative");
            }

            const double total = weights_.sum();
            if (!(total > 0.0))
            {
                throw std::invalid_argument("Weights must have a positive sum, got: " + std::to_string(total));
            }

            weights_ /= total;
        }

        bool WeightVector::contains(const std::string &symbol) const
        {
            for (const auto &s : symbols_)
            {
                if (s == symbol)
                    return true;
            }
            return false;
        }

        double WeightVector::weight(const std::string &symbol) const
        {
            for (size_t i = 0; i < symbols_.size(); ++i)
            {
                if (symbols_[i] == symbol)
                {
                    return weights_(static_cast<Eigen::Index>(i));
                }
            }
            throw std::out_of_range("Symbol not in weight vector: " + symbol);
        }

        nlohmann::json WeightVector::to_json() const
        {
            nlohmann::json j = nlohmann::json::array();
            for (size_t i = 0; i < symbols_.size(); ++i)
            {
                j.push_back({{"symbol", symbols_[i]},
                             {"weight", weights_(static_cast<Eigen::Index>(i))}});
            }
            return j;
        }

    } // namespace optimizer
} // namespace allocation
