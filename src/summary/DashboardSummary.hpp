#pragma once

#include "dataframe/DataFrame.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace salescast {
namespace summary {

using json = nlohmann::json;

/**
 * Une ligne de classement: dimension + total agrégé
 */
struct RankedEntry {
    std::string name;
    double value = 0.0;

    bool operator==(const RankedEntry& other) const {
        return name == other.name && value == other.value;
    }
};

using Ranking = std::vector<RankedEntry>;

struct SummaryOptions {
    // Devise -> multiplicateur appliqué à Amount. Devise absente: 1 (montant brut)
    std::map<std::string, double> exchangeRates;

    size_t topCustomers = 5;
    size_t topCities = 10;
    size_t topItems = 10;
    size_t topSalespeople = 10;
};

/**
 * Classements du tableau de bord, calculés sur la table brute
 */
struct SalesSummary {
    Ranking customersByQuantity;   // somme de Quantity
    Ranking customersByAmount;     // somme de Amount converti
    Ranking citiesByDocuments;     // nombre de Document Number distincts
    Ranking itemsByQuantity;
    Ranking salespeopleByAmount;   // vide sans colonne Sales Name
    bool hasSalespeople = false;

    json toJson() const;
};

/**
 * Agrégats "top N" de la table de ventes
 *
 * Les cellules numériques vides comptent pour 0, les lignes dont la
 * dimension est vide sont ignorées. Tri décroissant, égalités par nom.
 */
class DashboardSummary {
public:
    explicit DashboardSummary(SummaryOptions options = {});

    /// Throws SchemaError (colonnes manquantes ou Quantity/Amount non numériques)
    SalesSummary summarize(const DataFrame& sales) const;

    /// Amount multiplié par le taux de sa devise
    double convertAmount(double amount, const std::string& currency) const;

    const SummaryOptions& options() const { return m_options; }

    /// "Rupiah:1, US Dollar:16000" -> {Rupiah: 1, US Dollar: 16000}
    static std::map<std::string, double> parseExchangeRates(const std::string& text);

private:
    SummaryOptions m_options;
};

} // namespace summary
} // namespace salescast
