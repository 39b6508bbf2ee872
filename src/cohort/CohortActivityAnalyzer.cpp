#include "cohort/CohortActivityAnalyzer.hpp"
#include "forecast/SalesSchema.hpp"
#include "util/DateUtil.hpp"
#include "server/Profiler.hpp"
#include <map>
#include <set>

namespace salescast {
namespace cohort {

namespace columns = forecast::columns;

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // anonymous namespace

json QuarterlyActivity::toJson() const {
    return json{
        {"quarter", quarter},
        {"active_customers", activeCustomers},
        {"inactive_customers", inactiveCustomers}
    };
}

std::vector<QuarterlyActivity> CohortActivityAnalyzer::analyze(const DataFrame& sales) {
    std::vector<std::string> missing;
    for (const char* name : {columns::DATE, columns::CUSTOMER_NAME}) {
        if (!sales.hasColumn(name)) missing.push_back(name);
    }
    if (!missing.empty()) {
        throw forecast::SchemaError("Missing required columns: " + joinNames(missing));
    }

    server::ScopedTimer timer("cohort.analyze");

    // (année, trimestre) -> clients du trimestre
    std::map<std::pair<int, int>, std::set<std::string>> byQuarter;

    size_t rows = sales.rowCount();
    for (size_t row = 0; row < rows; ++row) {
        CalendarDate date;
        try {
            date = parseDate(sales.cellAsString(columns::DATE, row));
        } catch (const DateParseError& e) {
            throw DateParseError(std::string(e.what()) + " (row " + std::to_string(row + 1) + ")");
        }
        byQuarter[{date.year, quarterOf(date)}].insert(sales.cellAsString(columns::CUSTOMER_NAME, row));
    }

    std::vector<QuarterlyActivity> activity;
    activity.reserve(byQuarter.size());

    std::set<std::string> cumulative;
    for (const auto& [quarter, active] : byQuarter) {
        cumulative.insert(active.begin(), active.end());

        QuarterlyActivity record;
        record.quarter = quarterLabel(CalendarDate{quarter.first, (quarter.second - 1) * 3 + 1, 1});
        record.activeCustomers.assign(active.begin(), active.end());
        for (const auto& customer : cumulative) {
            if (active.count(customer) == 0) {
                record.inactiveCustomers.push_back(customer);
            }
        }
        activity.push_back(std::move(record));
    }

    return activity;
}

json CohortActivityAnalyzer::toJson(const std::vector<QuarterlyActivity>& activity) {
    json result = json::array();
    for (const auto& record : activity) {
        result.push_back(record.toJson());
    }
    return result;
}

DataFramePtr CohortActivityAnalyzer::toDataFrame(const std::vector<QuarterlyActivity>& activity) {
    auto df = std::make_shared<DataFrame>();
    df->addStringColumn("Quarter");
    df->addStringColumn("Active Customers");
    df->addStringColumn("Inactive Customers");

    for (const auto& record : activity) {
        df->addRow({record.quarter, joinNames(record.activeCustomers), joinNames(record.inactiveCustomers)});
    }
    return df;
}

} // namespace cohort
} // namespace salescast
