#include "summary/DashboardSummary.hpp"
#include "forecast/SalesSchema.hpp"
#include "server/Profiler.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace salescast {
namespace summary {

namespace columns = forecast::columns;

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(" \t") - first + 1);
}

// Quantity est déjà vérifiée par SalesSchema::validate
void requireNumeric(const DataFrame& sales, const char* name) {
    if (sales.getColumn(name)->getType() == ColumnTypeOpt::STRING) {
        throw forecast::SchemaError(std::string("Column '") + name + "' must be numeric");
    }
}

// Cellule vide (NaN) = 0, comme une somme pandas
double numericOrZero(const DataFrame& sales, const char* name, size_t row) {
    double value = sales.numericAt(name, row);
    return std::isnan(value) ? 0.0 : value;
}

Ranking topN(const std::unordered_map<std::string, double>& totals, size_t n) {
    Ranking ranking;
    ranking.reserve(totals.size());
    for (const auto& [name, value] : totals) {
        ranking.push_back(RankedEntry{name, value});
    }
    std::sort(ranking.begin(), ranking.end(), [](const RankedEntry& a, const RankedEntry& b) {
        if (a.value != b.value) return a.value > b.value;
        return a.name < b.name;
    });
    if (ranking.size() > n) ranking.resize(n);
    return ranking;
}

json rankingToJson(const Ranking& ranking) {
    json out = json::array();
    for (const auto& entry : ranking) {
        out.push_back(json{{"name", entry.name}, {"value", entry.value}});
    }
    return out;
}

} // anonymous namespace

json SalesSummary::toJson() const {
    return json{
        {"top_customers_by_quantity", rankingToJson(customersByQuantity)},
        {"top_customers_by_amount", rankingToJson(customersByAmount)},
        {"top_cities_by_documents", rankingToJson(citiesByDocuments)},
        {"top_items_by_quantity", rankingToJson(itemsByQuantity)},
        {"top_salespeople_by_amount", hasSalespeople ? rankingToJson(salespeopleByAmount) : json(nullptr)}
    };
}

DashboardSummary::DashboardSummary(SummaryOptions options)
    : m_options(std::move(options))
{
    for (const auto& [currency, rate] : m_options.exchangeRates) {
        if (!std::isfinite(rate) || rate <= 0.0) {
            throw std::invalid_argument("Invalid exchange rate for " + currency);
        }
    }
}

double DashboardSummary::convertAmount(double amount, const std::string& currency) const {
    auto it = m_options.exchangeRates.find(currency);
    return it == m_options.exchangeRates.end() ? amount : amount * it->second;
}

std::map<std::string, double> DashboardSummary::parseExchangeRates(const std::string& text) {
    std::map<std::string, double> rates;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        if (comma == std::string::npos) comma = text.size();
        std::string item = trim(text.substr(pos, comma - pos));
        pos = comma + 1;
        if (item.empty()) continue;

        size_t colon = item.rfind(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("Expected CURRENCY:RATE, got '" + item + "'");
        }
        std::string currency = trim(item.substr(0, colon));
        std::string rateText = trim(item.substr(colon + 1));

        size_t used = 0;
        double rate = 0.0;
        try {
            rate = std::stod(rateText, &used);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Invalid rate for " + currency + ": '" + rateText + "'");
        }
        if (currency.empty() || used != rateText.size() || !std::isfinite(rate) || rate <= 0.0) {
            throw std::invalid_argument("Invalid rate for '" + currency + "': '" + rateText + "'");
        }
        rates[currency] = rate;
    }
    return rates;
}

SalesSummary DashboardSummary::summarize(const DataFrame& sales) const {
    forecast::SalesSchema::validate(sales);
    requireNumeric(sales, columns::AMOUNT);

    server::ScopedTimer timer("summary");

    SalesSummary summary;
    summary.hasSalespeople = sales.hasColumn(columns::SALES_NAME);

    std::unordered_map<std::string, double> customerQuantity;
    std::unordered_map<std::string, double> customerAmount;
    std::unordered_map<std::string, std::set<std::string>> cityDocuments;
    std::unordered_map<std::string, double> itemQuantity;
    std::unordered_map<std::string, double> salespersonAmount;

    for (size_t row = 0; row < sales.rowCount(); ++row) {
        double quantity = numericOrZero(sales, columns::QUANTITY, row);
        double amount = convertAmount(numericOrZero(sales, columns::AMOUNT, row),
                                      sales.cellAsString(columns::CURRENCY, row));

        std::string customer = sales.cellAsString(columns::CUSTOMER_NAME, row);
        if (!customer.empty()) {
            customerQuantity[customer] += quantity;
            customerAmount[customer] += amount;
        }

        std::string city = sales.cellAsString(columns::CITY, row);
        std::string document = sales.cellAsString(columns::DOCUMENT_NUMBER, row);
        if (!city.empty() && !document.empty()) {
            cityDocuments[city].insert(document);
        }

        std::string item = sales.cellAsString(columns::ITEM_NAME, row);
        if (!item.empty()) {
            itemQuantity[item] += quantity;
        }

        if (summary.hasSalespeople) {
            std::string salesperson = sales.cellAsString(columns::SALES_NAME, row);
            if (!salesperson.empty()) {
                salespersonAmount[salesperson] += amount;
            }
        }
    }

    std::unordered_map<std::string, double> cityCounts;
    for (const auto& [city, documents] : cityDocuments) {
        cityCounts[city] = static_cast<double>(documents.size());
    }

    summary.customersByQuantity = topN(customerQuantity, m_options.topCustomers);
    summary.customersByAmount = topN(customerAmount, m_options.topCustomers);
    summary.citiesByDocuments = topN(cityCounts, m_options.topCities);
    summary.itemsByQuantity = topN(itemQuantity, m_options.topItems);
    summary.salespeopleByAmount = topN(salespersonAmount, m_options.topSalespeople);

    return summary;
}

} // namespace summary
} // namespace salescast
