/**
 * @file performance_report.cpp
 * @brief Implementation of PerformanceReportBuilder and report output.
 */

#include "perfbook/analytics/performance_report.hpp"
#include "perfbook/analytics/benchmark_aligner.hpp"
#include "perfbook/analytics/cash_flow_classifier.hpp"
#include "perfbook/analytics/risk_statistics.hpp"
#include "perfbook/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace perfbook
{
    namespace analytics
    {

        namespace
        {

            void put_optional(nlohmann::json &j, const std::string &key, const std::optional<double> &v)
            {
                j[key] = v ? nlohmann::json(*v) : nlohmann::json(nullptr);
            }

            void put_optional(nlohmann::json &j, const std::string &key, const std::optional<std::string> &v)
            {
                j[key] = v ? nlohmann::json(*v) : nlohmann::json(nullptr);
            }

            nlohmann::json points_to_json(const std::vector<ValuationPoint> &points)
            {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto &p : points)
                {
                    arr.push_back({p.date, p.value});
                }
                return arr;
            }

            std::string format_percent(const std::optional<double> &v)
            {
                if (!v)
                {
                    return "n/a";
                }
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(2) << (*v * 100.0) << "%";
                return oss.str();
            }

            std::string format_number(const std::optional<double> &v, int precision)
            {
                if (!v)
                {
                    return "n/a";
                }
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(precision) << *v;
                return oss.str();
            }

            void write_optional(std::ofstream &out, const std::optional<double> &v)
            {
                if (v)
                {
                    out << *v;
                }
            }

            /**
             * @brief Growth of 1.0 dated at the valuation points, when every
             *        interval produced a return.
             */
            std::vector<ValuationPoint> growth_points(const std::vector<ValuationPoint> &values,
                                                      const TwrResult &twr)
            {
                std::vector<ValuationPoint> out;
                if (values.size() < 2 || twr.subperiods.size() != values.size() - 1)
                {
                    return out;
                }
                const std::vector<double> curve = ReturnCalculator::growth_curve(twr.returns());
                for (size_t i = 0; i < values.size(); ++i)
                {
                    out.push_back({values[i].date, curve[i]});
                }
                return out;
            }

            /**
             * @brief Benchmark returns between consecutive valuation dates.
             *
             * Each date takes the last benchmark price on or before it. Empty
             * when a date precedes the first price or follows the last one.
             */
            std::vector<double> benchmark_returns_at(const std::vector<ValuationPoint> &values,
                                                     const std::vector<ValuationPoint> &prices)
            {
                std::vector<double> out;
                if (values.size() < 2 || prices.empty() || values.back().date > prices.back().date)
                {
                    return out;
                }
                std::vector<double> sampled;
                for (const auto &v : values)
                {
                    auto it = std::upper_bound(prices.begin(), prices.end(), v.date,
                                               [](const std::string &date, const ValuationPoint &p)
                                               { return date < p.date; });
                    if (it == prices.begin())
                    {
                        return {};
                    }
                    sampled.push_back(std::prev(it)->value);
                }
                for (size_t i = 1; i < sampled.size(); ++i)
                {
                    out.push_back(sampled[i] / sampled[i - 1] - 1.0);
                }
                return out;
            }

            /**
             * @brief Gain, XIRR, TWR, risk statistics and benchmark excess of
             *        a row whose flows and anchor values are already filled in.
             */
            void fill_return_metrics(PerformanceRow &row,
                                     const AnchorSelection &anchors,
                                     const std::vector<ValuationPoint> &values,
                                     const ReportRequest &request,
                                     const std::optional<double> &benchmark_twr,
                                     const std::optional<double> &benchmark_sharpe,
                                     const std::vector<ValuationPoint> &benchmark_prices,
                                     bool combined)
            {
                const int ppy = data::periods_per_year(request.frequency);
                const bool complete = anchors.complete();

                if (complete)
                {
                    row.gain_value = anchors.end->value - anchors.begin->value - row.net_flow;
                }

                // XIRR flows are investor perspective: the portfolio is "bought"
                // at the begin value and "sold" at the end value.
                if (complete && anchors.begin->date != anchors.end->date &&
                    anchors.begin->value > 0.0 && anchors.end->value >= 0.0)
                {
                    std::vector<CashFlow> cashflows;
                    cashflows.push_back({anchors.begin->date, -anchors.begin->value});
                    for (const auto &f : row.flows)
                    {
                        cashflows.push_back({f.date, -f.amount});
                    }
                    cashflows.push_back({anchors.end->date, anchors.end->value});
                    row.xirr = ReturnCalculator::xirr(cashflows);
                }
                else if (anchors.begin)
                {
                    row.warnings.push_back(std::string(combined ? "Combined " : "") +
                                           "IRR/XIRR needs at least 2 valuation points in the period.");
                }

                std::vector<double> subperiod_returns;
                if (complete && values.size() >= 2)
                {
                    TwrResult twr = ReturnCalculator::time_weighted_return(values, row.flows);
                    row.twr = twr.twr;
                    row.warnings.insert(row.warnings.end(), twr.warnings.begin(), twr.warnings.end());
                    subperiod_returns = twr.returns();
                    row.growth = growth_points(values, twr);
                }
                else if (combined && !values.empty())
                {
                    row.warnings.push_back("Combined TWR needs at least 2 valuation points in the period.");
                }

                if (!subperiod_returns.empty())
                {
                    // Regression needs a return for every interval so both series line up.
                    std::vector<double> bench_returns;
                    if (subperiod_returns.size() == values.size() - 1)
                    {
                        bench_returns = benchmark_returns_at(values, benchmark_prices);
                    }
                    RiskStatistics stats(subperiod_returns, request.risk_free_rate_annual, ppy, bench_returns);
                    row.sharpe = stats.sharpe();
                    row.volatility = stats.volatility();
                    row.sortino = stats.sortino();
                    row.max_drawdown = stats.max_drawdown();
                    row.beta = stats.beta();
                    row.alpha = stats.alpha();
                    row.correlation = stats.correlation();
                    row.tracking_error = stats.tracking_error();
                    if (!benchmark_prices.empty() && subperiod_returns.size() >= 2 && bench_returns.empty())
                    {
                        row.warnings.push_back("Beta and tracking error need " + request.label() +
                                               " prices covering every valuation date.");
                    }
                }
                if (!combined && !row.sharpe && complete && values.size() >= 2)
                {
                    if (subperiod_returns.size() < 2)
                    {
                        row.warnings.push_back("Sharpe requires at least 2 period returns (≥3 valuation points).");
                    }
                    else
                    {
                        row.warnings.push_back("Sharpe is undefined for this period (insufficient return variability).");
                    }
                }

                row.benchmark_twr = benchmark_twr;
                row.benchmark_sharpe = benchmark_sharpe;
                if (!combined && benchmark_twr && values.size() < 2)
                {
                    row.warnings.push_back(request.label() +
                                           " benchmark shown for selected period; portfolio has <2 valuation points.");
                }
                row.excess_twr = ReturnCalculator::excess_return(row.twr, benchmark_twr);
                row.excess_sharpe = ReturnCalculator::excess_return(row.sharpe, benchmark_sharpe);
            }

            void apply_cash_summary(PerformanceRow &row, const CashFlowSummary &cash)
            {
                row.flows = cash.flows;
                row.contributions = cash.contributions;
                row.withdrawals = cash.withdrawals;
                row.net_flow = cash.net_flow;
                row.fees = cash.fees;
                row.withholding = cash.withholding;
                row.other_cash_out = cash.other_cash_out;
                row.total_cash_out = cash.total_cash_out();
                row.txn_count = cash.txn_count;
                row.txn_start = cash.txn_start;
                row.txn_end = cash.txn_end;
            }

            std::vector<int> account_ids(const std::vector<data::Account> &accounts)
            {
                std::vector<int> ids;
                ids.reserve(accounts.size());
                for (const auto &a : accounts)
                {
                    ids.push_back(a.id);
                }
                return ids;
            }

            int parse_scope_id(const std::string &scope, size_t prefix_length)
            {
                const std::string raw = scope.substr(prefix_length);
                try
                {
                    size_t used = 0;
                    const int id = std::stoi(raw, &used);
                    if (used != raw.size())
                    {
                        throw InvalidRequest("Invalid scope: " + scope);
                    }
                    return id;
                }
                catch (const std::invalid_argument &)
                {
                    throw InvalidRequest("Invalid scope: " + scope);
                }
                catch (const std::out_of_range &)
                {
                    throw InvalidRequest("Invalid scope: " + scope);
                }
            }

        } // anonymous namespace

        // ===================================================================
        // ReportRequest
        // ===================================================================

        ReportRequest ReportRequest::from_config(const ReportConfig &config)
        {
            ReportRequest request;
            request.scope = config.scope;
            request.start_date = config.start_date;
            request.end_date = config.end_date;
            request.frequency = data::parse_frequency(config.frequency);
            request.benchmark_symbol = config.benchmark_symbol;
            request.benchmark_label = config.benchmark_label;
            request.baseline_grace_days = config.baseline_grace_days;
            request.risk_free_rate_annual = config.risk_free_rate_annual;
            request.include_withholding_as_flow = config.include_withholding_as_flow;
            request.include_combined = config.include_combined;
            return request;
        }

        void ReportRequest::validate() const
        {
            data::require_valid_date(start_date, "start_date");
            data::require_valid_date(end_date, "end_date");
            if (end_date < start_date)
            {
                throw InvalidRequest("end_date " + end_date + " is before start_date " + start_date);
            }
            if (baseline_grace_days < 0)
            {
                throw InvalidRequest("baseline_grace_days must be >= 0, got: " + std::to_string(baseline_grace_days));
            }
            if (!std::isfinite(risk_free_rate_annual))
            {
                throw InvalidRequest("risk_free_rate_annual must be a finite number");
            }
        }

        // ===================================================================
        // Output
        // ===================================================================

        nlohmann::json PerformanceRow::to_json() const
        {
            nlohmann::json j;
            j["portfolio_id"] = portfolio_id;
            j["portfolio_name"] = portfolio_name;
            j["period_start"] = period_start;
            j["period_end"] = period_end;
            put_optional(j, "coverage_start", coverage_start);
            put_optional(j, "coverage_end", coverage_end);
            j["valuation_points"] = valuation_points;
            put_optional(j, "begin_date", begin_date);
            put_optional(j, "end_date", end_date);
            put_optional(j, "txn_start", txn_start);
            put_optional(j, "txn_end", txn_end);
            j["txn_count"] = txn_count;
            put_optional(j, "begin_value", begin_value);
            put_optional(j, "end_value", end_value);
            j["contributions"] = contributions;
            j["withdrawals"] = withdrawals;
            j["net_flow"] = net_flow;
            j["fees"] = fees;
            j["withholding"] = withholding;
            j["other_cash_out"] = other_cash_out;
            j["total_cash_out"] = total_cash_out;
            put_optional(j, "gain_value", gain_value);
            put_optional(j, "xirr", xirr);
            put_optional(j, "twr", twr);
            put_optional(j, "volatility", volatility);
            put_optional(j, "sharpe", sharpe);
            put_optional(j, "sortino", sortino);
            put_optional(j, "max_drawdown", max_drawdown);
            put_optional(j, "benchmark_twr", benchmark_twr);
            put_optional(j, "benchmark_sharpe", benchmark_sharpe);
            put_optional(j, "excess_twr", excess_twr);
            put_optional(j, "excess_sharpe", excess_sharpe);
            put_optional(j, "beta", beta);
            put_optional(j, "alpha", alpha);
            put_optional(j, "correlation", correlation);
            put_optional(j, "tracking_error", tracking_error);

            nlohmann::json flow_arr = nlohmann::json::array();
            for (const auto &f : flows)
            {
                flow_arr.push_back({f.date, f.amount});
            }
            j["flows"] = flow_arr;
            j["growth"] = points_to_json(growth);
            j["warnings"] = warnings;
            return j;
        }

        nlohmann::json PerformanceReport::to_json() const
        {
            nlohmann::json j;
            j["requested_start"] = requested_start;
            j["requested_end"] = requested_end;
            j["frequency"] = data::to_string(frequency);
            j["baseline_grace_days"] = baseline_grace_days;
            j["risk_free_rate_annual"] = risk_free_rate_annual;
            j["include_withholding_as_flow"] = include_withholding_as_flow;
            j["benchmark_label"] = benchmark_label;
            put_optional(j, "benchmark_twr", benchmark_twr);
            put_optional(j, "benchmark_sharpe", benchmark_sharpe);
            put_optional(j, "benchmark_coverage_start", benchmark_coverage_start);
            put_optional(j, "benchmark_coverage_end", benchmark_coverage_end);
            j["benchmark_growth"] = points_to_json(benchmark_growth);

            nlohmann::json row_arr = nlohmann::json::array();
            for (const auto &row : rows)
            {
                row_arr.push_back(row.to_json());
            }
            j["rows"] = row_arr;
            j["combined"] = combined ? combined->to_json() : nlohmann::json(nullptr);
            j["warnings"] = warnings;
            return j;
        }

        std::string PerformanceReport::summary() const
        {
            std::ostringstream oss;
            oss << "Performance " << requested_start << " to " << requested_end
                << " (" << data::to_string(frequency) << ", benchmark " << benchmark_label << ")\n";
            oss << std::left << std::setw(24) << "Portfolio"
                << std::right << std::setw(14) << "Begin"
                << std::setw(14) << "End"
                << std::setw(12) << "Net Flow"
                << std::setw(12) << "Gain"
                << std::setw(10) << "XIRR"
                << std::setw(10) << "TWR"
                << std::setw(8) << "Sharpe"
                << std::setw(10) << "Excess" << "\n";
            oss << std::string(114, '-') << "\n";

            auto print_row = [&oss](const PerformanceRow &row)
            {
                oss << std::left << std::setw(24) << row.portfolio_name.substr(0, 23)
                    << std::right << std::setw(14) << format_number(row.begin_value, 2)
                    << std::setw(14) << format_number(row.end_value, 2)
                    << std::setw(12) << format_number(row.net_flow, 2)
                    << std::setw(12) << format_number(row.gain_value, 2)
                    << std::setw(10) << format_percent(row.xirr)
                    << std::setw(10) << format_percent(row.twr)
                    << std::setw(8) << format_number(row.sharpe, 2)
                    << std::setw(10) << format_percent(row.excess_twr) << "\n";
            };
            for (const auto &row : rows)
            {
                print_row(row);
            }
            if (combined)
            {
                print_row(*combined);
            }
            oss << "Benchmark TWR: " << format_percent(benchmark_twr)
                << ", Sharpe: " << format_number(benchmark_sharpe, 2) << "\n";

            for (const auto &w : warnings)
            {
                oss << "  ! " << w << "\n";
            }
            for (const auto &row : rows)
            {
                for (const auto &w : row.warnings)
                {
                    oss << "  ! [" << row.portfolio_name << "] " << w << "\n";
                }
            }
            if (combined)
            {
                for (const auto &w : combined->warnings)
                {
                    oss << "  ! [" << combined->portfolio_name << "] " << w << "\n";
                }
            }
            return oss.str();
        }

        void PerformanceReport::export_csv(const std::string &filepath) const
        {
            std::filesystem::path p(filepath);
            if (p.has_parent_path())
            {
                std::filesystem::create_directories(p.parent_path());
            }
            std::ofstream out(filepath);
            if (!out.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }
            out << std::fixed << std::setprecision(8);

            out << "portfolio_id,portfolio_name,begin_date,end_date,begin_value,end_value,contributions,"
                   "withdrawals,net_flow,fees,withholding,other_cash_out,total_cash_out,gain_value,xirr,twr,"
                   "volatility,sharpe,sortino,max_drawdown,benchmark_twr,benchmark_sharpe,excess_twr,"
                   "excess_sharpe,beta,alpha,correlation,tracking_error,warning_count\n";

            auto write_row = [&out](const PerformanceRow &row)
            {
                out << row.portfolio_id << ',' << row.portfolio_name << ','
                    << row.begin_date.value_or("") << ',' << row.end_date.value_or("") << ',';
                write_optional(out, row.begin_value);
                out << ',';
                write_optional(out, row.end_value);
                out << ',' << row.contributions << ',' << row.withdrawals << ',' << row.net_flow << ','
                    << row.fees << ',' << row.withholding << ',' << row.other_cash_out << ','
                    << row.total_cash_out << ',';
                for (const auto *v : {&row.gain_value, &row.xirr, &row.twr, &row.volatility, &row.sharpe,
                                      &row.sortino, &row.max_drawdown, &row.benchmark_twr,
                                      &row.benchmark_sharpe, &row.excess_twr, &row.excess_sharpe,
                                      &row.beta, &row.alpha, &row.correlation, &row.tracking_error})
                {
                    write_optional(out, *v);
                    out << ',';
                }
                out << row.warnings.size() << '\n';
            };
            for (const auto &row : rows)
            {
                write_row(row);
            }
            if (combined)
            {
                write_row(*combined);
            }
        }

        // ===================================================================
        // PerformanceReportBuilder
        // ===================================================================

        PerformanceReportBuilder::PerformanceReportBuilder(std::vector<data::Account> accounts,
                                                           const data::TransactionSource &transactions,
                                                           const data::SnapshotSource &snapshots,
                                                           const data::CashBalanceSource *cash_balances,
                                                           const data::BenchmarkPriceSource *benchmark)
            : accounts_(std::move(accounts)),
              transactions_(transactions),
              snapshots_(snapshots),
              cash_balances_(cash_balances),
              benchmark_(benchmark)
        {
        }

        std::vector<data::Account> PerformanceReportBuilder::accounts_in_scope(const std::string &scope) const
        {
            static const std::string portfolio_prefix = "portfolio:";
            static const std::string taxpayer_prefix = "taxpayer:";

            std::vector<data::Account> out;
            if (scope == "all")
            {
                return accounts_;
            }
            if (scope == "taxable" || scope == "tax_advantaged")
            {
                const bool taxable = scope == "taxable";
                for (const auto &a : accounts_)
                {
                    if (a.is_taxable() == taxable)
                    {
                        out.push_back(a);
                    }
                }
                return out;
            }
            if (scope.rfind(portfolio_prefix, 0) == 0)
            {
                const int id = parse_scope_id(scope, portfolio_prefix.size());
                for (const auto &a : accounts_)
                {
                    if (a.portfolio_id == id)
                    {
                        out.push_back(a);
                    }
                }
                return out;
            }
            if (scope.rfind(taxpayer_prefix, 0) == 0)
            {
                const int id = parse_scope_id(scope, taxpayer_prefix.size());
                for (const auto &a : accounts_)
                {
                    if (a.taxpayer_id == id)
                    {
                        out.push_back(a);
                    }
                }
                return out;
            }
            throw InvalidRequest("Invalid scope: " + scope);
        }

        PerformanceReport PerformanceReportBuilder::build(const ReportRequest &request) const
        {
            request.validate();
            const std::vector<data::Account> scoped = accounts_in_scope(request.scope);
            const std::string label = request.label();

            spdlog::info("Building performance report for scope '{}' ({} to {}, {})",
                         request.scope, request.start_date, request.end_date, data::to_string(request.frequency));

            PerformanceReport report;
            report.requested_start = request.start_date;
            report.requested_end = request.end_date;
            report.frequency = request.frequency;
            report.baseline_grace_days = request.baseline_grace_days;
            report.risk_free_rate_annual = request.risk_free_rate_annual;
            report.include_withholding_as_flow = request.include_withholding_as_flow;
            report.benchmark_label = label;

            // Benchmark metrics are independent of portfolio snapshot coverage.
            BenchmarkMetrics benchmark;
            if (benchmark_ == nullptr)
            {
                report.warnings.push_back("No benchmark provider configured; " + label + " metrics are blank.");
            }
            else
            {
                const data::DateRange range{data::add_days(request.start_date, -BENCHMARK_LOOKBACK_DAYS),
                                            request.end_date};
                const data::PriceFetchResult fetched = benchmark_->get(request.benchmark_symbol, range);
                if (!fetched.success)
                {
                    spdlog::warn("Benchmark {} unavailable: {}", request.benchmark_symbol, fetched.message);
                    report.warnings.push_back("Benchmark " + label + " unavailable: " + fetched.message);
                }
                else
                {
                    if (!fetched.message.empty())
                    {
                        report.warnings.push_back("Benchmark " + label + ": " + fetched.message);
                    }
                    const AlignedBenchmark aligned = BenchmarkAligner(label).align(
                        fetched.series, request.start_date, request.end_date, request.frequency);
                    report.benchmark_coverage_start = aligned.coverage_start();
                    report.benchmark_coverage_end = aligned.coverage_end();
                    if (aligned.points.size() >= 2)
                    {
                        const TwrResult twr = ReturnCalculator::time_weighted_return(aligned.points, {});
                        benchmark.twr = twr.twr;
                        const std::vector<double> returns = twr.returns();
                        if (!returns.empty())
                        {
                            benchmark.sharpe = ReturnCalculator::sharpe_ratio(
                                returns, request.risk_free_rate_annual, data::periods_per_year(request.frequency));
                        }
                        report.benchmark_growth = growth_points(aligned.points, twr);
                        benchmark.prices = aligned.points;
                        report.warnings.insert(report.warnings.end(), aligned.warnings.begin(), aligned.warnings.end());
                    }
                }
            }
            report.benchmark_twr = benchmark.twr;
            report.benchmark_sharpe = benchmark.sharpe;

            if (scoped.empty())
            {
                report.warnings.push_back("No accounts in scope '" + request.scope + "'.");
                return report;
            }

            std::map<int, std::vector<data::Account>> members;
            for (const auto &a : scoped)
            {
                members[a.portfolio_id].push_back(a);
            }

            const int grace = request.baseline_grace_days;
            const data::DateRange snapshot_range{data::add_days(request.start_date, -grace),
                                                 data::add_days(request.end_date, grace)};
            const std::vector<data::HoldingsSnapshot> snapshots = snapshots_.list(account_ids(scoped), snapshot_range);
            const std::map<int, ValuationSeries> series_by_portfolio =
                SnapshotAggregator(scoped, cash_balances_).aggregate(snapshots);
            if (series_by_portfolio.empty())
            {
                report.warnings.push_back("No holdings snapshots found in the selected period; TWR/Sharpe will be blank.");
            }

            const ValuationSeries no_values;
            for (const auto &entry : members)
            {
                auto it = series_by_portfolio.find(entry.first);
                report.rows.push_back(portfolio_row(request, entry.first, entry.second,
                                                    it == series_by_portfolio.end() ? no_values : it->second,
                                                    benchmark));
            }

            if (request.include_combined)
            {
                report.combined = combined_row(request, report.rows, series_by_portfolio, members, benchmark);
            }

            spdlog::info("Performance report complete: {} portfolio rows, {} report warnings",
                         report.rows.size(), report.warnings.size());
            return report;
        }

        PerformanceRow PerformanceReportBuilder::portfolio_row(const ReportRequest &request,
                                                               int portfolio_id,
                                                               const std::vector<data::Account> &members,
                                                               const ValuationSeries &series,
                                                               const BenchmarkMetrics &benchmark) const
        {
            PerformanceRow row;
            row.portfolio_id = portfolio_id;
            if (members.size() == 1 && !members.front().name.empty())
            {
                row.portfolio_name = members.front().name;
            }
            else
            {
                row.portfolio_name = "Portfolio " + std::to_string(portfolio_id);
            }
            row.period_start = request.start_date;
            row.period_end = request.end_date;

            const AnchorSelection anchors =
                select_anchors(series, request.start_date, request.end_date, request.baseline_grace_days);
            const std::vector<ValuationPoint> window = downsample(series, request.frequency);
            if (!window.empty())
            {
                row.coverage_start = window.front().date;
                row.coverage_end = window.back().date;
            }
            row.valuation_points = static_cast<int>(window.size());
            if (anchors.begin)
            {
                row.begin_date = anchors.begin->date;
                row.begin_value = anchors.begin->value;
            }
            if (anchors.end)
            {
                row.end_date = anchors.end->date;
                row.end_value = anchors.end->value;
            }

            // Flows follow the anchors actually used, so activity between a
            // target date and its anchor is not mistaken for performance.
            const std::string flow_start = anchors.begin ? anchors.begin->date : request.start_date;
            const std::string flow_end = anchors.end ? anchors.end->date : request.end_date;
            const CashFlowSummary cash = CashFlowClassifier(request.include_withholding_as_flow)
                                             .classify(transactions_.list(account_ids(members),
                                                                          data::DateRange{flow_start, flow_end}),
                                                       flow_start, flow_end);
            apply_cash_summary(row, cash);
            row.warnings.insert(row.warnings.end(), cash.warnings.begin(), cash.warnings.end());
            row.warnings.insert(row.warnings.end(), anchors.warnings.begin(), anchors.warnings.end());

            if (row.begin_value && row.end_value && *row.begin_value >= 0.0 && *row.end_value > 10000.0 &&
                *row.begin_value < 1000.0 && *row.begin_value / std::max(1.0, *row.end_value) < 0.001)
            {
                row.warnings.push_back(
                    "Begin value looks unusually small vs end value; verify holdings snapshot totals (statement parsing).");
            }

            const std::vector<ValuationPoint> values = restrict_to_anchors(series, anchors, request.frequency);
            fill_return_metrics(row, anchors, values, request, benchmark.twr, benchmark.sharpe, benchmark.prices, false);

            for (const auto &w : row.warnings)
            {
                spdlog::debug("[{}] {}", row.portfolio_name, w);
            }
            return row;
        }

        std::optional<PerformanceRow> PerformanceReportBuilder::combined_row(
            const ReportRequest &request,
            const std::vector<PerformanceRow> &rows,
            const std::map<int, ValuationSeries> &series_by_portfolio,
            const std::map<int, std::vector<data::Account>> &members,
            const BenchmarkMetrics &benchmark) const
        {
            const int grace = request.baseline_grace_days;
            const std::string baseline_lo = data::add_days(request.start_date, -grace);
            const std::string baseline_hi = data::add_days(request.start_date, grace);

            PerformanceRow row;
            row.portfolio_id = 0;
            row.portfolio_name = "Combined";
            row.period_start = request.start_date;
            row.period_end = request.end_date;

            std::vector<int> baseline_ids;
            std::string excluded;
            for (const auto &r : rows)
            {
                const bool has_baseline = r.coverage_start && *r.coverage_start >= baseline_lo &&
                                          *r.coverage_start <= baseline_hi && r.begin_value.has_value();
                if (has_baseline)
                {
                    baseline_ids.push_back(r.portfolio_id);
                }
                else
                {
                    excluded += (excluded.empty() ? "" : ", ") + r.portfolio_name;
                }
            }
            if (baseline_ids.empty())
            {
                return std::nullopt;
            }
            if (!excluded.empty())
            {
                row.warnings.push_back(
                    "Combined metrics exclude portfolios without a baseline snapshot near period start: " + excluded);
            }

            const CombinedSeries combined = combine_series(series_by_portfolio, baseline_ids);
            row.warnings.insert(row.warnings.end(), combined.warnings.begin(), combined.warnings.end());

            const AnchorSelection anchors =
                select_anchors(combined.values, request.start_date, request.end_date, grace);
            const std::vector<ValuationPoint> values = restrict_to_anchors(combined.values, anchors, request.frequency);
            if (!anchors.complete())
            {
                row.warnings.push_back("Combined metrics need valuation points near both period start and end.");
            }

            if (anchors.begin)
            {
                row.begin_date = anchors.begin->date;
                row.begin_value = anchors.begin->value;
            }
            if (anchors.end)
            {
                row.end_date = anchors.end->date;
                row.end_value = anchors.end->value;
            }
            if (!values.empty())
            {
                row.coverage_start = values.front().date;
                row.coverage_end = values.back().date;
            }
            else if (!combined.values.empty())
            {
                row.coverage_start = combined.values.begin()->first;
                row.coverage_end = combined.values.rbegin()->first;
            }
            row.valuation_points = static_cast<int>(values.size());

            std::vector<int> ids;
            for (int pid : baseline_ids)
            {
                for (const auto &a : members.at(pid))
                {
                    ids.push_back(a.id);
                }
            }
            const std::string flow_start = anchors.begin ? anchors.begin->date : request.start_date;
            const std::string flow_end = anchors.end ? anchors.end->date : request.end_date;
            const CashFlowSummary cash = CashFlowClassifier(request.include_withholding_as_flow)
                                             .classify(transactions_.list(ids, data::DateRange{flow_start, flow_end}),
                                                       flow_start, flow_end);
            apply_cash_summary(row, cash);

            fill_return_metrics(row, anchors, values, request, benchmark.twr, benchmark.sharpe, benchmark.prices, true);
            return row;
        }

    } // namespace analytics
} // namespace perfbook
