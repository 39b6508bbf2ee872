#pragma once

#include "dataframe/DataFrame.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace salescast {
namespace cohort {

using json = nlohmann::json;

/**
 * Clients actifs / inactifs d'un trimestre
 *
 * inactive = clients vus dans un trimestre antérieur mais pas dans celui-ci.
 * Les deux listes sont triées.
 */
struct QuarterlyActivity {
    std::string quarter;                       // "2024Q1"
    std::vector<std::string> activeCustomers;
    std::vector<std::string> inactiveCustomers;

    json toJson() const;
};

/**
 * Analyse de cohortes trimestrielles sur la table de ventes brute
 *
 * Fonction pure: seules les colonnes Date et Customer Name sont lues.
 */
class CohortActivityAnalyzer {
public:
    /// Un enregistrement par trimestre présent dans la table, ordre croissant
    static std::vector<QuarterlyActivity> analyze(const DataFrame& sales);

    static json toJson(const std::vector<QuarterlyActivity>& activity);

    /// Table Quarter / Active Customers / Inactive Customers (listes jointes par ", ")
    static DataFramePtr toDataFrame(const std::vector<QuarterlyActivity>& activity);
};

} // namespace cohort
} // namespace salescast
