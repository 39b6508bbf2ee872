#pragma once

#include "Column.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>

namespace salescast {

using json = nlohmann::json;

class DataFrame;

/**
 * Conversion des cellules et des tables vers texte / JSON
 *
 * Une cellule DOUBLE vide (NaN) vaut "" en texte et null en JSON.
 */
class DataFrameSerializer {
public:
    // Précision par défaut: assez de chiffres pour relire la même valeur
    static constexpr int EXACT_PRECISION = 17;

    static std::string cellToString(const IColumn& column, size_t row,
                                    int precision = EXACT_PRECISION);
    static json cellToJson(const IColumn& column, size_t row);

    // En-tête + au plus maxRows lignes, séparées par des tabulations
    static std::string toString(const DataFrame& df, size_t maxRows = 10);

    // Format colonnaire : {"columns": [...], "data": [[...], [...]]}
    static json toJson(const DataFrame& df);

    static std::string columnTypeToString(ColumnTypeOpt type);
};

} // namespace salescast
