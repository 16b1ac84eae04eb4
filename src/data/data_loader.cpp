/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "perfbook/data/data_loader.hpp"
#include "perfbook/data/date_utils.hpp"
#include "perfbook/data/sources.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace perfbook
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    ReportConfig ReportConfig::from_json(const nlohmann::json &j)
    {
        ReportConfig config;
        config.scope = j.value("scope", "all");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.frequency = j.value("frequency", "month_end");
        config.benchmark_symbol = j.value("benchmark_symbol", "VOO");
        config.benchmark_label = j.value("benchmark_label", config.benchmark_symbol);
        config.baseline_grace_days = j.value("baseline_grace_days", 14);
        config.risk_free_rate_annual = j.value("risk_free_rate_annual", 0.0);
        config.include_withholding_as_flow = j.value("include_withholding_as_flow", false);
        config.include_combined = j.value("include_combined", true);
        return config;
    }

    RebuildConfig RebuildConfig::from_json(const nlohmann::json &j)
    {
        RebuildConfig config;
        config.taxpayer_id = j.value("taxpayer_id", 0);
        config.wash_include_tax_advantaged = j.value("wash_include_tax_advantaged", false);
        config.wash_window_days = j.value("wash_window_days", 30);
        return config;
    }

    InputConfig InputConfig::from_json(const nlohmann::json &j)
    {
        InputConfig config;
        config.accounts = j.value("accounts", "data/accounts.json");
        config.transactions = j.value("transactions", "data/transactions.csv");
        config.snapshots = j.value("snapshots", "data/snapshots.json");
        config.cash_balances = j.value("cash_balances", "");
        config.corporate_actions = j.value("corporate_actions", "");
        config.benchmark_dir = j.value("benchmark_dir", "data/benchmarks");
        config.security_groups = j.value("security_groups", "");
        return config;
    }

    EngineConfig EngineConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // Configuration Loading
    // ===========================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    EngineConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        EngineConfig config;
        config.report = ReportConfig::from_json(j.value("report", nlohmann::json::object()));
        config.rebuild = RebuildConfig::from_json(j.value("rebuild", nlohmann::json::object()));
        config.inputs = InputConfig::from_json(j.value("inputs", nlohmann::json::object()));

        if (j.contains("logging"))
        {
            config.log_level = j["logging"].value("level", "info");
        }

        return config;
    }

    // ===========================
    // Ledger Inputs - JSON
    // ===========================

    std::vector<data::Account> DataLoader::load_accounts(const std::string &filepath)
    {
        auto j = load_json(filepath);
        if (!j.is_array())
        {
            throw std::runtime_error("Accounts file must contain a JSON array: " + filepath);
        }

        std::vector<data::Account> accounts;
        for (const auto &item : j)
        {
            data::Account a;
            a.id = item.at("id").get<int>();
            a.taxpayer_id = item.value("taxpayer_id", 0);
            a.portfolio_id = item.value("portfolio_id", a.id);
            a.name = item.value("name", "Account " + std::to_string(a.id));
            try
            {
                a.type = data::parse_account_type(item.value("type", "taxable"));
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error(std::string(e.what()) + " (account " + std::to_string(a.id) + ")");
            }
            accounts.push_back(a);
        }
        return accounts;
    }

    std::vector<data::HoldingsSnapshot> DataLoader::load_snapshots(const std::string &filepath)
    {
        auto j = load_json(filepath);
        if (!j.is_array())
        {
            throw std::runtime_error("Snapshots file must contain a JSON array: " + filepath);
        }

        std::vector<data::HoldingsSnapshot> snapshots;
        for (const auto &item : j)
        {
            data::HoldingsSnapshot s;
            s.account_id = item.at("account_id").get<int>();
            s.as_of = item.at("as_of").get<std::string>();
            if (!is_valid_date_format(s.as_of.substr(0, 10)))
            {
                continue;
            }
            for (const auto &line : item.value("items", nlohmann::json::array()))
            {
                data::SnapshotItem si;
                si.symbol = line.value("symbol", "");
                si.market_value = line.value("market_value", 0.0);
                si.is_total = line.value("is_total", false);
                s.items.push_back(si);
            }
            snapshots.push_back(s);
        }
        return snapshots;
    }

    std::map<std::string, std::vector<std::string>> DataLoader::load_security_groups(const std::string &filepath)
    {
        auto j = load_json(filepath);
        if (!j.is_object())
        {
            throw std::runtime_error("Security groups file must contain a JSON object: " + filepath);
        }

        std::map<std::string, std::vector<std::string>> groups;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            groups[it.key()] = it.value().get<std::vector<std::string>>();
        }
        return groups;
    }

    // ===========================
    // Ledger Inputs - CSV
    // ===========================

    std::vector<data::Transaction> DataLoader::load_transactions(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty transactions file: " + filepath);
        }
        auto header = index_header(line);
        for (const char *required : {"id", "account_id", "date", "type", "amount"})
        {
            if (!header.count(required))
            {
                throw std::runtime_error("Transactions file missing column '" + std::string(required) + "': " + filepath);
            }
        }

        std::vector<data::Transaction> transactions;
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            data::Transaction t;
            t.date = field(fields, header, "date");
            double id = safe_stod(field(fields, header, "id"));
            double account = safe_stod(field(fields, header, "account_id"));
            double amount = safe_stod(field(fields, header, "amount"));
            if (!is_valid_date_format(t.date) || std::isnan(id) || std::isnan(account) || std::isnan(amount))
            {
                continue;
            }
            t.id = static_cast<int>(id);
            t.account_id = static_cast<int>(account);
            t.amount = amount;
            t.type = data::parse_transaction_type(field(fields, header, "type"));

            std::string ticker = field(fields, header, "ticker");
            if (!ticker.empty())
                t.ticker = ticker;

            double qty = safe_stod(field(fields, header, "quantity"));
            if (!std::isnan(qty))
                t.quantity = qty;

            for (const auto &[name, idx] : header)
            {
                if (name == "id" || name == "account_id" || name == "date" || name == "type" ||
                    name == "amount" || name == "ticker" || name == "quantity")
                {
                    continue;
                }
                if (idx < fields.size() && !trim(fields[idx]).empty())
                {
                    t.metadata[name] = trim(fields[idx]);
                }
            }
            transactions.push_back(t);
        }

        std::stable_sort(transactions.begin(), transactions.end(), data::ledger_order);
        return transactions;
    }

    std::vector<data::CashBalance> DataLoader::load_cash_balances(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            return {};
        }
        auto header = index_header(line);
        if (!header.count("account_id") || !header.count("date") || !header.count("balance"))
        {
            throw std::runtime_error("Cash balance file needs account_id,date,balance columns: " + filepath);
        }

        std::vector<data::CashBalance> balances;
        while (std::getline(file, line))
        {
            auto fields = parse_csv_line(line);
            data::CashBalance b;
            b.date = field(fields, header, "date");
            double account = safe_stod(field(fields, header, "account_id"));
            double balance = safe_stod(field(fields, header, "balance"));
            if (!is_valid_date_format(b.date) || std::isnan(account) || std::isnan(balance))
            {
                continue;
            }
            b.account_id = static_cast<int>(account);
            b.balance = balance;
            balances.push_back(b);
        }
        return balances;
    }

    std::vector<data::CorporateActionEvent> DataLoader::load_corporate_actions(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            return {};
        }
        auto header = index_header(line);
        for (const char *required : {"id", "taxpayer_id", "security_id", "action_date", "action_type"})
        {
            if (!header.count(required))
            {
                throw std::runtime_error("Corporate action file missing column '" + std::string(required) + "': " + filepath);
            }
        }

        std::vector<data::CorporateActionEvent> events;
        while (std::getline(file, line))
        {
            auto fields = parse_csv_line(line);
            data::CorporateActionEvent e;
            e.action_date = field(fields, header, "action_date");
            double id = safe_stod(field(fields, header, "id"));
            double taxpayer = safe_stod(field(fields, header, "taxpayer_id"));
            if (!is_valid_date_format(e.action_date) || std::isnan(id) || std::isnan(taxpayer))
            {
                continue;
            }
            e.id = static_cast<int>(id);
            e.taxpayer_id = static_cast<int>(taxpayer);
            e.security_id = field(fields, header, "security_id");
            std::transform(e.security_id.begin(), e.security_id.end(), e.security_id.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            e.action_type = field(fields, header, "action_type");
            std::transform(e.action_type.begin(), e.action_type.end(), e.action_type.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });

            double account = safe_stod(field(fields, header, "account_id"));
            if (!std::isnan(account))
                e.account_id = static_cast<int>(account);
            double ratio = safe_stod(field(fields, header, "ratio"));
            if (!std::isnan(ratio))
                e.ratio = ratio;

            events.push_back(e);
        }
        return events;
    }

    data::PriceSeries DataLoader::load_price_series(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty price file: " + filepath);
        }
        auto header = index_header(line);
        if (!header.count("date"))
        {
            throw std::runtime_error("Price file has no date column: " + filepath);
        }

        std::string value_column;
        for (const char *candidate : {"adj_close", "close", "value", "price"})
        {
            if (header.count(candidate))
            {
                value_column = candidate;
                break;
            }
        }
        if (value_column.empty())
        {
            throw std::runtime_error("Price file needs one of adj_close, close, value, price: " + filepath);
        }

        data::PriceSeries raw;
        while (std::getline(file, line))
        {
            auto fields = parse_csv_line(line);
            std::string date = field(fields, header, "date").substr(0, 10);
            double price = safe_stod(field(fields, header, value_column));
            if (!is_valid_date_format(date) || std::isnan(price))
            {
                continue;
            }
            raw.push_back({date, price});
        }

        // stable order of appearance decides "last row wins" for duplicate dates
        return data::normalize_price_series(raw);
    }

    // ========================
    // Private Helper Methods
    // ========================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else if (c != '\r')
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::map<std::string, size_t> DataLoader::index_header(const std::string &line)
    {
        std::map<std::string, size_t> header;
        auto names = parse_csv_line(line);
        for (size_t i = 0; i < names.size(); ++i)
        {
            header[to_lower(trim(names[i]))] = i;
        }
        return header;
    }

    std::string DataLoader::field(const std::vector<std::string> &fields,
                                  const std::map<std::string, size_t> &header,
                                  const std::string &name)
    {
        auto it = header.find(name);
        if (it == header.end() || it->second >= fields.size())
        {
            return "";
        }
        return trim(fields[it->second]);
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        return data::is_valid_date(date);
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            return "";
        }
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::to_lower(const std::string &str)
    {
        std::string out = str;
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        try
        {
            return std::stod(trimmed);
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace perfbook
