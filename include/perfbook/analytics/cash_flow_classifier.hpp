/**
 * @file cash_flow_classifier.hpp
 * @brief Splits ledger cash movements into investor flows and cash-out drag.
 *
 * Investor flows are what return math treats as external money
 * (portfolio perspective: deposits positive, withdrawals negative).
 * Fees, withholding and other cash-out stay inside performance as drag
 * and are only reported. Internal sweeps and FX settlement shuttles are
 * noise and are dropped entirely.
 */

#ifndef PERFBOOK_ANALYTICS_CASH_FLOW_CLASSIFIER_HPP
#define PERFBOOK_ANALYTICS_CASH_FLOW_CLASSIFIER_HPP

#include "perfbook/analytics/return_calculator.hpp"
#include "perfbook/data/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace perfbook
{
    namespace analytics
    {

        /**
         * @struct CashFlowSummary
         * @brief Classified cash activity of one portfolio over a window.
         */
        struct CashFlowSummary
        {
            std::vector<CashFlow> flows; ///< Investor flows, date ascending
            double contributions = 0.0;  ///< Sum of positive flows
            double withdrawals = 0.0;    ///< Sum of |negative flows|
            double net_flow = 0.0;
            double fees = 0.0;
            double withholding = 0.0;
            double other_cash_out = 0.0;

            int txn_count = 0;
            std::optional<std::string> txn_start;
            std::optional<std::string> txn_end;
            std::vector<std::string> warnings;

            double total_cash_out() const { return withdrawals + fees + withholding + other_cash_out; }
        };

        /**
         * @class CashFlowClassifier
         * @brief Classifies TRANSFER, FEE, WITHHOLDING and OTHER transactions.
         */
        class CashFlowClassifier
        {
        public:
            static constexpr double AMOUNT_EPSILON = 1e-9;

            /**
             * @param include_withholding_as_flow Treat WITHHOLDING as an investor
             *        flow instead of withholding drag.
             */
            explicit CashFlowClassifier(bool include_withholding_as_flow = false);

            /**
             * @brief Classify every transaction dated in [flow_start, flow_end].
             *
             * Transactions sharing a provider dedup key are counted once.
             */
            CashFlowSummary classify(const std::vector<data::Transaction> &transactions,
                                     const std::string &flow_start,
                                     const std::string &flow_end) const;

            /**
             * @brief Whether a transfer's text marks it as an internal sweep or
             *        FX/multi-currency settlement.
             */
            static bool is_internal_transfer(const std::string &raw_type, const std::string &description);

            /** @brief "description additional_detail" of a transaction, trimmed. */
            static std::string description_of(const data::Transaction &txn);

            /**
             * @brief Drop same-day transfers that cancel to the cent.
             *
             * Transfers are bucketed by (date, |amount| rounded to cents); in each
             * bucket min(#positive, #negative) pairs are removed and the residual
             * transfers kept. Zero amounts are dropped. Output is sorted by
             * (date, amount).
             */
            static std::vector<CashFlow> filter_offsetting_pairs(const std::vector<CashFlow> &transfers);

            /** @brief Round to two decimals. */
            static double round_cents(double value);

        private:
            bool include_withholding_as_flow_;
        };

    } // namespace analytics
} // namespace perfbook

#endif // PERFBOOK_ANALYTICS_CASH_FLOW_CLASSIFIER_HPP
