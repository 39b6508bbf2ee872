#include "forecast/GroupExtractor.hpp"
#include <cstring>
#include <functional>
#include <unordered_map>

namespace salescast {
namespace forecast {

namespace {

// Clé de hachage: une valeur 64 bits par dimension (id de string, entier, bits du double)
struct EncodedKey {
    std::vector<uint64_t> values;

    bool operator==(const EncodedKey& other) const {
        return values == other.values;
    }
};

struct EncodedKeyHash {
    size_t operator()(const EncodedKey& key) const {
        size_t hash = 0;
        for (auto v : key.values) {
            hash ^= std::hash<uint64_t>{}(v) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
        }
        return hash;
    }
};

using ExtractorFn = std::function<uint64_t(size_t)>;

ExtractorFn makeExtractor(const IColumnPtr& col) {
    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
        return [intCol](size_t i) -> uint64_t {
            return static_cast<uint64_t>(intCol->at(i));
        };
    }
    if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
        return [doubleCol](size_t i) -> uint64_t {
            double val = doubleCol->at(i);
            uint64_t bits;
            std::memcpy(&bits, &val, sizeof(double));
            return bits;
        };
    }
    auto stringCol = std::dynamic_pointer_cast<StringColumn>(col);
    return [stringCol](size_t i) -> uint64_t {
        return static_cast<uint64_t>(stringCol->getId(i));
    };
}

using MissingFn = std::function<bool(size_t)>;

// Cellule sans valeur: chaîne vide ou NaN (les entiers sont toujours renseignés)
MissingFn makeMissingCheck(const IColumnPtr& col) {
    if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
        return [doubleCol](size_t i) { return doubleCol->isNull(i); };
    }
    if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
        return [stringCol](size_t i) { return stringCol->at(i).empty(); };
    }
    return [](size_t) { return false; };
}

} // anonymous namespace

GroupExtractor::GroupExtractor(GroupingScheme scheme)
    : m_scheme(scheme)
    , m_dimensions(SalesSchema::dimensionColumns(scheme))
{
}

GroupExtractor GroupExtractor::forTable(const DataFrame& df) {
    GroupExtractor extractor(SalesSchema::detectScheme(df));
    extractor.requireDimensions(df);
    return extractor;
}

void GroupExtractor::requireDimensions(const DataFrame& df) const {
    for (const auto& name : m_dimensions) {
        if (!df.hasColumn(name)) {
            throw SchemaError("Missing grouping column '" + name + "'");
        }
    }
}

std::vector<GroupKey> GroupExtractor::extractKeys(const DataFrame& df) const {
    std::vector<GroupKey> keys;
    for (auto& group : extractGroups(df)) {
        keys.push_back(std::move(group.key));
    }
    return keys;
}

std::vector<GroupedRows> GroupExtractor::extractGroups(const DataFrame& df) const {
    requireDimensions(df);

    std::vector<ExtractorFn> extractors;
    std::vector<MissingFn> missing;
    extractors.reserve(m_dimensions.size());
    missing.reserve(m_dimensions.size());
    for (const auto& name : m_dimensions) {
        extractors.push_back(makeExtractor(df.getColumn(name)));
        missing.push_back(makeMissingCheck(df.getColumn(name)));
    }

    std::unordered_map<EncodedKey, size_t, EncodedKeyHash> positions;
    std::vector<GroupedRows> groups;

    size_t rowCount = df.rowCount();
    for (size_t i = 0; i < rowCount; ++i) {
        // Une dimension vide n'appartient à aucun groupe
        bool incomplete = false;
        for (const auto& isMissing : missing) {
            if (isMissing(i)) {
                incomplete = true;
                break;
            }
        }
        if (incomplete) continue;

        EncodedKey encoded;
        encoded.values.reserve(extractors.size());
        for (const auto& extract : extractors) {
            encoded.values.push_back(extract(i));
        }

        auto it = positions.find(encoded);
        if (it == positions.end()) {
            GroupedRows group;
            for (const auto& name : m_dimensions) {
                group.key.values.push_back(df.cellAsString(name, i));
            }
            positions.emplace(std::move(encoded), groups.size());
            groups.push_back(std::move(group));
            groups.back().rows.push_back(i);
        } else {
            groups[it->second].rows.push_back(i);
        }
    }

    return groups;
}

} // namespace forecast
} // namespace salescast
