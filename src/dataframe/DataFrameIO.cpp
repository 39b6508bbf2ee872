#include "DataFrameIO.hpp"
#include "DataFrameSerializer.hpp"
#include <fstream>
#include <cctype>
#include <stdexcept>

namespace salescast {

namespace {

constexpr const char* BLANKS = " \t\r\n";

bool isBlank(const std::string& line) {
    return line.find_first_not_of(BLANKS) == std::string::npos;
}

std::string trimmed(const std::string& field) {
    size_t first = field.find_first_not_of(BLANKS);
    if (first == std::string::npos) return "";
    return field.substr(first, field.find_last_not_of(BLANKS) - first + 1);
}

// Découpe une ligne CSV ("" = guillemet échappé dans un champ quoté)
std::vector<std::string> splitRecord(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"' && quoted && i + 1 < line.size() && line[i + 1] == '"') {
            current += '"';
            ++i;
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == delimiter && !quoted) {
            fields.push_back(trimmed(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(trimmed(current));
    return fields;
}

std::string escapeField(const std::string& value, char delimiter) {
    if (value.find_first_of(std::string{delimiter, '"', '\n'}) == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        out += c;
        if (c == '"') out += '"';
    }
    out += '"';
    return out;
}

// Type le plus étroit capable de porter la valeur (non vide)
ColumnTypeOpt classify(const std::string& value) {
    size_t pos = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    size_t digits = 0;
    bool dot = false;

    for (; pos < value.size(); ++pos) {
        char c = value[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++digits;
        } else if (c == '.' && !dot) {
            dot = true;
        } else {
            return ColumnTypeOpt::STRING;
        }
    }

    if (digits == 0) return ColumnTypeOpt::STRING;
    // Au-delà de 18 chiffres on sort de la portée d'un int64
    if (dot || digits > 18) return ColumnTypeOpt::DOUBLE;
    return ColumnTypeOpt::INT;
}

// INT < DOUBLE < STRING
ColumnTypeOpt widen(ColumnTypeOpt a, ColumnTypeOpt b) {
    return static_cast<int>(a) > static_cast<int>(b) ? a : b;
}

/**
 * Type d'une colonne sur toutes les lignes. Une colonne entièrement vide
 * est STRING; une colonne entière avec des trous devient DOUBLE (NaN).
 */
ColumnTypeOpt inferColumn(const std::vector<std::vector<std::string>>& records, size_t column) {
    ColumnTypeOpt type = ColumnTypeOpt::INT;
    bool anyValue = false;
    bool anyHole = false;

    for (const auto& record : records) {
        const std::string& cell = record[column];
        if (cell.empty()) {
            anyHole = true;
            continue;
        }
        anyValue = true;
        type = widen(type, classify(cell));
        if (type == ColumnTypeOpt::STRING) break;
    }

    if (!anyValue) return ColumnTypeOpt::STRING;
    if (anyHole && type == ColumnTypeOpt::INT) return ColumnTypeOpt::DOUBLE;
    return type;
}

} // anonymous namespace

std::shared_ptr<DataFrame> DataFrameIO::readCSV(
    const std::string& filepath,
    char delimiter,
    bool hasHeader
) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return readCSV(file, delimiter, hasHeader);
}

std::shared_ptr<DataFrame> DataFrameIO::readCSV(
    std::istream& input,
    char delimiter,
    bool hasHeader
) {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> records;
    bool first = true;
    std::string line;

    while (std::getline(input, line)) {
        if (isBlank(line)) continue;

        auto fields = splitRecord(line, delimiter);
        if (first) {
            first = false;
            if (hasHeader) {
                headers = std::move(fields);
                continue;
            }
            for (size_t i = 0; i < fields.size(); ++i) {
                headers.push_back("col" + std::to_string(i));
            }
        }
        // Lignes courtes complétées, champs en trop ignorés
        fields.resize(headers.size());
        records.push_back(std::move(fields));
    }

    auto df = std::make_shared<DataFrame>();
    for (size_t i = 0; i < headers.size(); ++i) {
        switch (inferColumn(records, i)) {
            case ColumnTypeOpt::INT: df->addIntColumn(headers[i]); break;
            case ColumnTypeOpt::DOUBLE: df->addDoubleColumn(headers[i]); break;
            case ColumnTypeOpt::STRING: df->addStringColumn(headers[i]); break;
        }
        df->getColumn(headers[i])->reserve(records.size());
    }
    df->getStringPool()->reserve(records.size());

    for (const auto& record : records) {
        df->addRow(record);
    }
    return df;
}

void DataFrameIO::writeCSV(
    const DataFrame& df,
    const std::string& filepath,
    char delimiter,
    bool includeHeader
) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filepath);
    }
    writeCSV(df, file, delimiter, includeHeader);
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing file: " + filepath);
    }
}

void DataFrameIO::writeCSV(
    const DataFrame& df,
    std::ostream& output,
    char delimiter,
    bool includeHeader
) {
    std::vector<IColumnPtr> columns;
    for (const auto& name : df.getColumnNames()) {
        columns.push_back(df.getColumn(name));
    }

    auto writeLine = [&](auto&& cellAt) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) output << delimiter;
            output << cellAt(c);
        }
        output << '\n';
    };

    if (includeHeader) {
        writeLine([&](size_t c) { return escapeField(columns[c]->getName(), delimiter); });
    }

    for (size_t row = 0; row < df.rowCount(); ++row) {
        writeLine([&](size_t c) {
            std::string cell = DataFrameSerializer::cellToString(*columns[c], row, 10);
            return columns[c]->getType() == ColumnTypeOpt::STRING ? escapeField(cell, delimiter) : cell;
        });
    }
}

} // namespace salescast
