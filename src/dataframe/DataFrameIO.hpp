#pragma once

#include "DataFrame.hpp"
#include <istream>
#include <string>
#include <memory>
#include <vector>

namespace salescast {

/**
 * IO CSV pour DataFrame
 *
 * Champs quotés ("" pour un guillemet), espaces autour des champs ignorés,
 * lignes vides sautées. Pas de champ multi-ligne.
 */
class DataFrameIO {
public:
    /**
     * Charge un CSV dans un DataFrame.
     * Le type de chaque colonne est déduit sur l'ensemble des lignes:
     * INT si toutes les valeurs sont entières, DOUBLE si toutes sont
     * numériques (les cellules vides deviennent NaN), STRING sinon.
     */
    static std::shared_ptr<DataFrame> readCSV(
        const std::string& filepath,
        char delimiter = ',',
        bool hasHeader = true
    );

    static std::shared_ptr<DataFrame> readCSV(
        std::istream& input,
        char delimiter = ',',
        bool hasHeader = true
    );

    /**
     * Sauvegarde un DataFrame en CSV (NaN écrit comme champ vide)
     */
    static void writeCSV(
        const DataFrame& df,
        const std::string& filepath,
        char delimiter = ',',
        bool includeHeader = true
    );

    static void writeCSV(
        const DataFrame& df,
        std::ostream& output,
        char delimiter = ',',
        bool includeHeader = true
    );
};

} // namespace salescast
