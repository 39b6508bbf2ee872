#pragma once

#include "Column.hpp"
#include "StringPool.hpp"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>

namespace salescast {

using json = nlohmann::json;

/**
 * Table colonnaire typée
 *
 * Sert à la fois pour la table brute des transactions (chargée depuis CSV)
 * et pour la table de résultat des prévisions. Les colonnes texte créées
 * par la table partagent son StringPool.
 *
 * - DataFrame: structure et accès aux cellules
 * - DataFrameIO: lecture/écriture CSV
 * - DataFrameSerializer: texte et JSON
 */
class DataFrame {
public:
    DataFrame() : m_pool(std::make_shared<StringPool>()) {}

    void addColumn(IColumnPtr column);
    void setColumn(IColumnPtr column);  // remplace si le nom existe déjà
    void addIntColumn(const std::string& name);
    void addDoubleColumn(const std::string& name);
    void addStringColumn(const std::string& name);

    // throw std::out_of_range si absente
    IColumnPtr getColumn(const std::string& name) const;
    std::shared_ptr<StringColumn> getStringColumn(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return m_index.count(name) > 0; }
    std::vector<std::string> getColumnNames() const;
    size_t columnCount() const { return m_columns.size(); }
    size_t rowCount() const { return m_columns.empty() ? 0 : m_columns.front()->size(); }
    bool empty() const { return rowCount() == 0; }

    // Valeur numérique d'une cellule INT ou DOUBLE (throw pour STRING)
    double numericAt(const std::string& column, size_t row) const;

    // Représentation texte d'une cellule, quel que soit son type
    std::string cellAsString(const std::string& column, size_t row) const;

    // Valeurs converties selon le type de chaque colonne ("" = NaN pour DOUBLE)
    void addRow(const std::vector<std::string>& values);

    // Concatène les lignes d'une table au schéma identique
    void append(const DataFrame& other);

    std::string toString(size_t maxRows = 10) const;
    json toJson() const;

    std::shared_ptr<StringPool> getStringPool() const { return m_pool; }

private:
    std::vector<IColumnPtr> m_columns;                  // ordre d'insertion
    std::unordered_map<std::string, size_t> m_index;    // nom -> position
    std::shared_ptr<StringPool> m_pool;
};

using DataFramePtr = std::shared_ptr<DataFrame>;

} // namespace salescast
