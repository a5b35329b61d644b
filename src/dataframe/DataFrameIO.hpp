#pragma once

#include "DataFrame.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace dataframe {

/**
 * Lecture et écriture CSV
 *
 * Lecture : champs entre guillemets (guillemet doublé = guillemet
 * littéral, retours à la ligne autorisés), espaces autour des champs non
 * quotés supprimés, lignes vides ignorées, lignes courtes complétées par
 * des nulls. Une cellule vide est nulle.
 *
 * Le type d'une colonne est décidé sur toutes ses valeurs : INT si toutes
 * sont entières, DOUBLE si numériques (ou entières avec des cellules
 * vides), STRING sinon. Avec un séparateur autre que ',', la virgule
 * décimale est acceptée ("7,25").
 */
class DataFrameIO {
public:
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
     * Écrit la frame ; les nulls deviennent des champs vides
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

private:
    /**
     * Types observés sur les valeurs d'une colonne
     */
    struct ColumnProfile {
        ColumnTypeOpt type = ColumnTypeOpt::INT;
        bool sawValue = false;
        bool sawEmpty = false;

        void observe(const std::string& value, char delimiter);
        ColumnTypeOpt resolve() const;
    };

    /// Lit le prochain enregistrement non vide ; false en fin de flux
    static bool readRecord(std::istream& input, char delimiter, std::vector<std::string>& fields);

    static std::string quoteField(const std::string& field, char delimiter);

    static ColumnTypeOpt detectType(const std::string& value, char delimiter);
    static double parseDouble(const std::string& value, char delimiter);
};

} // namespace dataframe
