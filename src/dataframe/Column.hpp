#pragma once

#include "StringPool.hpp"
#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <cmath>
#include <limits>

namespace salescast {

enum class ColumnTypeOpt {
    INT,
    DOUBLE,
    STRING
};

/**
 * Interface commune des colonnes typées
 */
class IColumn {
public:
    virtual ~IColumn() = default;

    virtual const std::string& getName() const = 0;
    virtual ColumnTypeOpt getType() const = 0;
    virtual size_t size() const = 0;
    virtual void reserve(size_t capacity) = 0;

    // Indices des lignes dont la valeur vaut exactement `value`
    virtual std::vector<size_t> filterEqual(const std::string& value) const = 0;

    // Ajoute toutes les valeurs d'une colonne de même type
    virtual void append(const IColumn& other) = 0;
};

using IColumnPtr = std::shared_ptr<IColumn>;

/**
 * Stockage vectoriel partagé par les colonnes concrètes
 */
template <typename Derived, typename Stored>
class ColumnStorage : public IColumn {
public:
    const std::string& getName() const override { return m_name; }
    size_t size() const override { return m_values.size(); }
    void reserve(size_t capacity) override { m_values.reserve(capacity); }
    const std::vector<Stored>& data() const { return m_values; }

    void append(const IColumn& other) override {
        const ColumnStorage& src = dynamic_cast<const Derived&>(other);
        m_values.insert(m_values.end(), src.m_values.begin(), src.m_values.end());
    }

protected:
    explicit ColumnStorage(std::string name) : m_name(std::move(name)) {}

    std::vector<size_t> positionsOf(const Stored& target) const {
        std::vector<size_t> rows;
        for (size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i] == target) rows.push_back(i);
        }
        return rows;
    }

    std::string m_name;
    std::vector<Stored> m_values;
};

/**
 * Colonne d'entiers (quantités entières, compteurs)
 */
class IntColumn : public ColumnStorage<IntColumn, int64_t> {
public:
    explicit IntColumn(std::string name) : ColumnStorage(std::move(name)) {}

    ColumnTypeOpt getType() const override { return ColumnTypeOpt::INT; }

    void push_back(int64_t value) { m_values.push_back(value); }
    int64_t at(size_t index) const { return m_values[index]; }

    std::vector<size_t> filterEqual(const std::string& value) const override {
        return positionsOf(std::stoll(value));
    }
};

/**
 * Colonne de doubles. NaN représente une cellule vide.
 */
class DoubleColumn : public ColumnStorage<DoubleColumn, double> {
public:
    explicit DoubleColumn(std::string name) : ColumnStorage(std::move(name)) {}

    static double null() { return std::numeric_limits<double>::quiet_NaN(); }

    ColumnTypeOpt getType() const override { return ColumnTypeOpt::DOUBLE; }

    void push_back(double value) { m_values.push_back(value); }
    double at(size_t index) const { return m_values[index]; }
    bool isNull(size_t index) const { return std::isnan(m_values[index]); }

    // NaN != NaN: une cellule vide ne matche jamais
    std::vector<size_t> filterEqual(const std::string& value) const override {
        return positionsOf(std::stod(value));
    }
};

/**
 * Colonne de strings encodée par dictionnaire (voir StringPool)
 */
class StringColumn : public ColumnStorage<StringColumn, StringPool::StringId> {
public:
    using StringId = StringPool::StringId;

    StringColumn(std::string name, std::shared_ptr<StringPool> pool)
        : ColumnStorage(std::move(name)), m_pool(std::move(pool)) {}

    ColumnTypeOpt getType() const override { return ColumnTypeOpt::STRING; }

    void push_back(const std::string& value) { m_values.push_back(m_pool->intern(value)); }
    void push_back(StringId id) { m_values.push_back(id); }

    const std::string& at(size_t index) const { return m_pool->getString(m_values[index]); }
    StringId getId(size_t index) const { return m_values[index]; }
    std::shared_ptr<StringPool> getStringPool() const { return m_pool; }

    std::vector<size_t> filterEqual(const std::string& value) const override {
        // Valeur absente du pool: aucune ligne ne peut matcher
        StringId id = m_pool->find(value);
        return id == StringPool::INVALID_ID ? std::vector<size_t>{} : positionsOf(id);
    }

    void append(const IColumn& other) override {
        const auto& src = dynamic_cast<const StringColumn&>(other);
        if (src.m_pool == m_pool) {
            ColumnStorage::append(other);
            return;
        }
        // Pools différents: ré-interner chaque valeur
        m_values.reserve(m_values.size() + src.size());
        for (size_t i = 0; i < src.size(); ++i) {
            push_back(src.at(i));
        }
    }

private:
    std::shared_ptr<StringPool> m_pool;
};

} // namespace salescast
