#pragma once

#include <string>
#include <string_view>
#include <deque>
#include <unordered_map>
#include <cstdint>

namespace salescast {

/**
 * Dictionary encoding des valeurs texte (clients, articles, villes...)
 *
 * Chaque valeur distincte est stockée une seule fois; les colonnes ne
 * manipulent que des StringId. Deux cellules sont égales ssi leurs ids
 * sont égaux. L'index pointe dans m_values (deque: adresses stables).
 */
class StringPool {
public:
    using StringId = uint32_t;
    static constexpr StringId INVALID_ID = UINT32_MAX;

    StringPool() = default;
    StringPool(const StringPool&) = delete;
    StringPool& operator=(const StringPool&) = delete;

    StringId intern(std::string_view value) {
        StringId existing = find(value);
        if (existing != INVALID_ID) {
            return existing;
        }
        auto id = static_cast<StringId>(m_values.size());
        const std::string& stored = m_values.emplace_back(value);
        m_index.emplace(std::string_view(stored), id);
        return id;
    }

    // Lookup sans insertion
    StringId find(std::string_view value) const {
        auto it = m_index.find(value);
        return it == m_index.end() ? INVALID_ID : it->second;
    }

    // Chaîne vide pour un id inconnu
    const std::string& getString(StringId id) const {
        static const std::string missing;
        return id < m_values.size() ? m_values[id] : missing;
    }

    size_t size() const { return m_values.size(); }

    void reserve(size_t capacity) { m_index.reserve(capacity); }

private:
    std::deque<std::string> m_values;
    std::unordered_map<std::string_view, StringId> m_index;
};

} // namespace salescast
